#include "common.h"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

static std::string timestamp() {
  time_t now = time(nullptr);
  std::string dt = ctime(&now);
  dt.erase(dt.find_last_not_of("\n\r") + 1); // Trim trailing newline
  return dt;
}

void log_info(const std::string& tag, const std::string& msg) {
  std::cout << "[" << tag << "] " << msg << std::endl;
}

void log_warning(const std::string& msg) {
  std::cerr << "[WARN] [" << timestamp() << "] " << msg << std::endl;
}

void log_error(const std::string& msg) {
  std::cerr << "[ERROR] [" << timestamp() << "] " << msg << std::endl;
}

std::string bytesToHex(const uint8_t* data, size_t len) {
  std::stringstream ss;
  ss << std::hex << std::uppercase << std::setfill('0');
  for (size_t i = 0; i < len; ++i) {
    ss << std::setw(2) << (int)data[i];
  }
  return ss.str();
}

std::string bytesToHex(const std::vector<uint8_t>& bytes) {
  return bytesToHex(bytes.data(), bytes.size());
}

static int hexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::vector<uint8_t> hexToBytes(const std::string& hex) {
  if (hex.size() % 2 != 0) {
    throw ValidationError("Hex string has odd length: " + std::to_string(hex.size()));
  }
  std::vector<uint8_t> bytes;
  bytes.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hexNibble(hex[i]);
    int lo = hexNibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      throw ValidationError("Invalid hex character near offset " + std::to_string(i));
    }
    bytes.push_back((uint8_t)((hi << 4) | lo));
  }
  return bytes;
}

std::vector<uint8_t> toBytes(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}
