#include "backends/backend.hpp"

#include <cctype>

namespace bridge {
namespace {

static bool IsDatasetChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}  // namespace

std::optional<QualifiedTableName> ParseQualifiedTableName(const std::string& name, BridgeError* err) {
  auto invalid = [&]() -> std::optional<QualifiedTableName> {
    if (err) *err = MakeError(ErrorCode::kInvalidArgument, "Invalid table name: " + name, {{"table_name", name}});
    return std::nullopt;
  };

  auto dot = name.find('.');
  if (dot == std::string::npos || name.find('.', dot + 1) != std::string::npos) return invalid();

  QualifiedTableName out;
  out.dataset = name.substr(0, dot);
  out.table = name.substr(dot + 1);
  if (out.dataset.empty() || out.table.empty()) return invalid();
  for (char c : out.dataset) {
    if (!IsDatasetChar(c)) return invalid();
  }
  return out;
}

}  // namespace bridge
