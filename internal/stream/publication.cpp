#include "publication.hpp"

namespace rowcast::stream {

std::string QuoteWal2JsonName(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    if (c == ' ' || c == '\'' || c == ',' || c == '.' || c == '*' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

std::string Publication::Actions() const {
  std::string out;
  auto        add = [&](bool enabled, const char* action) {
    if (!enabled) return;
    if (!out.empty()) out += ',';
    out += action;
  };
  add(publish_insert, "insert");
  add(publish_update, "update");
  add(publish_delete, "delete");
  add(publish_truncate, "truncate");
  return out;
}

std::string Publication::AddTables() const {
  if (all_tables) return {};

  std::string out;
  for (const auto& [schema_name, table] : tables) {
    if (!out.empty()) out += ',';
    out += QuoteWal2JsonName(schema_name) + "." + QuoteWal2JsonName(table);
  }
  return out;
}

std::vector<std::string> Publication::Wal2JsonOptions() const {
  std::vector<std::string> options = {"include-pk",      "1",    "include-transaction", "false", "include-timestamp", "true",
                                      "write-in-chunks", "true", "format-version",      "2",     "actions",           Actions()};
  if (!all_tables) {
    options.push_back("add-tables");
    options.push_back(AddTables());
  }
  return options;
}

} // namespace rowcast::stream
