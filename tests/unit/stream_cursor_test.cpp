#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/stream/file_change_source.hpp"
#include "internal/stream/memory_change_source.hpp"
#include "internal/stream/stream_cursor.hpp"
#include "internal/util/errors.hpp"

namespace {

using rowcast::stream::MemoryChangeSource;
using rowcast::stream::StreamCursor;

std::shared_ptr<MemoryChangeSource> SourceWith(int n) {
  auto source = std::make_shared<MemoryChangeSource>("slot-test");
  for (int i = 1; i <= n; ++i) source->Append("change-" + std::to_string(i));
  return source;
}

void TestPeekIsRepeatable() {
  auto         repository = std::make_shared<rowcast::db::memory::MemoryRepository>();
  StreamCursor cursor(SourceWith(5), repository);

  auto first  = cursor.Peek(3);
  auto second = cursor.Peek(3);
  assert(first.size() == 3);
  assert(second.size() == 3);
  assert(first[0].payload == second[0].payload);
  assert(first[2].position == 3);
  assert(cursor.Position() == 0);
}

void TestConsumeAdvances() {
  auto         repository = std::make_shared<rowcast::db::memory::MemoryRepository>();
  auto         source     = SourceWith(5);
  StreamCursor cursor(source, repository);

  auto consumed = cursor.Consume(2);
  assert(consumed.size() == 2);
  assert(cursor.Position() == 2);
  assert(source->Retained() == 3);

  auto next = cursor.Peek(10);
  assert(next.size() == 3);
  assert(next[0].payload == "change-3");

  assert(cursor.Consume(10).size() == 3);
  assert(cursor.Consume(10).empty());
  assert(cursor.Position() == 5);
}

void TestRestartResumesFromStoredPosition() {
  auto repository = std::make_shared<rowcast::db::memory::MemoryRepository>();
  auto source     = SourceWith(4);

  {
    StreamCursor cursor(source, repository);
    cursor.Advance(3);
  }

  StreamCursor restarted(source, repository);
  assert(restarted.Position() == 3);
  auto pending = restarted.Peek(10);
  assert(pending.size() == 1);
  assert(pending[0].payload == "change-4");
}

void TestBackwardsAdvanceIsRejected() {
  auto         repository = std::make_shared<rowcast::db::memory::MemoryRepository>();
  StreamCursor cursor(SourceWith(4), repository);
  cursor.Advance(3);
  cursor.Advance(3);

  bool threw = false;
  try {
    cursor.Advance(2);
  } catch (const rowcast::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(cursor.Position() == 3);
}

void TestMemorySourceRejectsNonIncreasingPositions() {
  MemoryChangeSource source;
  source.AppendAt(10, "a");
  assert(source.Append("b") == 11);

  bool threw = false;
  try {
    source.AppendAt(11, "c");
  } catch (const rowcast::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestFileSourceUsesLineNumbers() {
  const auto dir = std::filesystem::temp_directory_path() / "rowcast_stream_cursor_tests";
  std::filesystem::create_directories(dir);
  const auto path = (dir / "changes.jsonl").string();
  {
    std::ofstream out(path, std::ios::trunc);
    out << "{\"n\":1}\n\n{\"n\":3}\r\n{\"n\":4}\n";
  }

  auto         repository = std::make_shared<rowcast::db::memory::MemoryRepository>();
  auto         source     = std::make_shared<rowcast::stream::FileChangeSource>(path);
  StreamCursor cursor(source, repository);

  auto all = cursor.Peek(10);
  assert(all.size() == 3);
  assert(all[0].position == 1);
  assert(all[1].position == 3);
  assert(all[1].payload == "{\"n\":3}");

  cursor.Advance(3);
  StreamCursor restarted(source, repository);
  auto         rest = restarted.Peek(10);
  assert(rest.size() == 1 && rest[0].position == 4);

  auto missing = std::make_shared<rowcast::stream::FileChangeSource>((dir / "missing.jsonl").string());
  bool threw   = false;
  try {
    (void)missing->Peek(0, 1);
  } catch (const rowcast::util::Unavailable&) {
    threw = true;
  }
  assert(threw);

  std::filesystem::remove_all(dir);
}

} // namespace

int main() {
  TestPeekIsRepeatable();
  TestConsumeAdvances();
  TestRestartResumesFromStoredPosition();
  TestBackwardsAdvanceIsRejected();
  TestMemorySourceRejectsNonIncreasingPositions();
  TestFileSourceUsesLineNumbers();

  std::cout << "rowcast_unit_stream_cursor: pass\n";
  return 0;
}
