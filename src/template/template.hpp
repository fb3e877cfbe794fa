#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "client/ipc_client.hpp"
#include "config.hpp"

namespace neutral_ipc {

// Renders one template (file path or inline source) against a JSON schema
// on the template server.
class Template {
public:
  explicit Template(IpcConfig config);

  // A JSON string schema is used verbatim; any other value is serialized.
  static Template from_file(IpcConfig config, const std::string &path,
                            const nlohmann::json &schema);
  static Template from_source(IpcConfig config, const std::string &source,
                              const nlohmann::json &schema);

  void set_path(const std::string &path);
  void set_source(const std::string &source);

  // Deep-merges schema into the current schema. Objects merge per key,
  // anything else replaces. A JSON string is parsed first.
  // Throws IpcError(Json) if either side is not valid JSON.
  void merge_schema(const nlohmann::json &schema);

  // Returns the rendered content (content-2 of the reply).
  // Throws IpcError on exchange failure or if content-1 is not JSON.
  std::string render();

  bool has_error() const;
  std::string status_code() const;
  std::string status_text() const;
  std::string status_param() const;

  // Parsed content-1 of the last reply; null before render().
  const nlohmann::json &result() const { return result_; }
  uint8_t status() const { return status_; }
  const std::string &content() const { return content_; }

  const std::string &schema() const { return schema_; }
  const std::string &template_text() const { return template_; }
  uint8_t template_type() const { return tpl_type_; }

private:
  std::string result_string(const char *key) const;

  IpcClient client_;
  std::string template_;
  uint8_t tpl_type_;
  std::string schema_;

  uint8_t status_ = 0;
  nlohmann::json result_;
  std::string content_;
};

} // namespace neutral_ipc
