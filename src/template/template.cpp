#include "template/template.hpp"

#include <utility>

#include "ipc_error.hpp"
#include "protocol/constants.hpp"

namespace neutral_ipc {

using nlohmann::json;

namespace {

std::string schema_text(const json &schema) {
  if (schema.is_string()) {
    return schema.get<std::string>();
  }
  return schema.dump();
}

json parse_json(const std::string &text, const char *what) {
  try {
    return json::parse(text);
  } catch (const json::parse_error &e) {
    throw IpcError(ErrorCode::Json,
                   std::string("invalid JSON in ") + what + ": " + e.what());
  }
}

json deep_merge(json a, const json &b) {
  if (!a.is_object() || !b.is_object()) {
    return b;
  }
  for (auto it = b.begin(); it != b.end(); ++it) {
    auto existing = a.find(it.key());
    if (existing != a.end()) {
      *existing = deep_merge(*existing, it.value());
    } else {
      a[it.key()] = it.value();
    }
  }
  return a;
}

} // namespace

Template::Template(IpcConfig config)
    : client_(std::move(config)), tpl_type_(ipc_protocol::kContentPath),
      schema_("{}") {}

Template Template::from_file(IpcConfig config, const std::string &path,
                             const json &schema) {
  Template t(std::move(config));
  t.set_path(path);
  t.schema_ = schema_text(schema);
  return t;
}

Template Template::from_source(IpcConfig config, const std::string &source,
                               const json &schema) {
  Template t(std::move(config));
  t.set_source(source);
  t.schema_ = schema_text(schema);
  return t;
}

void Template::set_path(const std::string &path) {
  tpl_type_ = ipc_protocol::kContentPath;
  template_ = path;
}

void Template::set_source(const std::string &source) {
  tpl_type_ = ipc_protocol::kContentText;
  template_ = source;
}

void Template::merge_schema(const json &schema) {
  json current = parse_json(schema_, "current schema");
  json incoming =
      schema.is_string() ? parse_json(schema.get<std::string>(), "schema")
                         : schema;

  schema_ = deep_merge(std::move(current), incoming).dump();
}

std::string Template::render() {
  Request req;
  req.control = ipc_protocol::kCtrlParseTemplate;
  req.format1 = ipc_protocol::kContentJson;
  req.content1 = schema_;
  req.format2 = tpl_type_;
  req.content2 = template_;

  ipc_protocol::Record reply = client_.exchange(req);

  json parsed = parse_json(reply.content1, "server result");

  status_ = reply.control;
  result_ = std::move(parsed);
  content_ = std::move(reply.content2);
  return content_;
}

bool Template::has_error() const {
  if (status_ != ipc_protocol::kCtrlStatusOk) {
    return true;
  }
  if (result_.is_object()) {
    auto it = result_.find("has_error");
    if (it != result_.end() && it->is_boolean()) {
      return it->get<bool>();
    }
  }
  return false;
}

std::string Template::result_string(const char *key) const {
  if (!result_.is_object()) {
    return std::string();
  }
  auto it = result_.find(key);
  if (it == result_.end() || !it->is_string()) {
    return std::string();
  }
  return it->get<std::string>();
}

std::string Template::status_code() const {
  return result_string("status_code");
}

std::string Template::status_text() const {
  return result_string("status_text");
}

std::string Template::status_param() const {
  return result_string("status_param");
}

} // namespace neutral_ipc
