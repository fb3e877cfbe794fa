#pragma once

#include <cstddef>
#include <cstdint>

namespace ipc_protocol {

// Record version 0 (draft). The reserved byte is written as zero and
// recorded but not checked on read.
constexpr uint8_t kReserved = 0;

// reserved(1) control(1) format-1(1) length-1(4) format-2(1) length-2(4)
constexpr size_t kHeaderLen = 12;

// Control: request operations
constexpr uint8_t kCtrlParseTemplate = 10;

// Control: response status
constexpr uint8_t kCtrlStatusOk = 0;
constexpr uint8_t kCtrlStatusKo = 1;

// Content formats
constexpr uint8_t kContentJson = 10;
constexpr uint8_t kContentPath = 20;
constexpr uint8_t kContentText = 30;
constexpr uint8_t kContentBin = 40;

} // namespace ipc_protocol
