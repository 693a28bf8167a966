#include <cstdlib>
#include <iostream>
#include <sstream>

#include "chatpack/config.hpp"
#include "chatpack/encoding.hpp"
#include "chatpack/filter.hpp"
#include "chatpack/locale_date.hpp"
#include "chatpack/merge.hpp"
#include "chatpack/parser.hpp"
#include "chatpack/pipeline.hpp"
#include "chatpack/writers.hpp"

static int fail(const std::string& msg, const char* file, int line) {
  std::cerr << "TEST FAIL: " << msg << " (" << file << ":" << line << ")\n";
  return 1;
}

#define EXPECT_TRUE(x)         \
  do {                         \
    if (!(x)) {                \
      return fail(#x, __FILE__, __LINE__); \
    }                          \
  } while (0)

#define EXPECT_EQ(a, b)                                              \
  do {                                                               \
    const auto _a = (a);                                             \
    const auto _b = (b);                                             \
    if (!(_a == _b)) {                                               \
      std::ostringstream ss;                                         \
      ss << #a << " == " << #b << " (got '" << _a << "' vs '" << _b << "')"; \
      return fail(ss.str(), __FILE__, __LINE__);                     \
    }                                                                \
  } while (0)

#define EXPECT_THROW(stmt, type)                                     \
  do {                                                               \
    bool _thrown = false;                                            \
    try {                                                            \
      stmt;                                                          \
    } catch (const type&) {                                          \
      _thrown = true;                                                \
    }                                                                \
    if (!_thrown) {                                                  \
      return fail(#stmt " did not throw " #type, __FILE__, __LINE__); \
    }                                                                \
  } while (0)

namespace {

using namespace chatpack;

// 2024-01-15 10:30:00 UTC
constexpr int64_t kJan15At1030 = 1705314600000LL;
constexpr int64_t kMinute = 60000LL;

struct Parsed {
  std::vector<Message> messages;
  std::size_t errors{0};
};

Parsed collect(RecordSource& source) {
  Parsed out;
  while (auto record = source.next()) {
    if (std::holds_alternative<Message>(*record)) {
      out.messages.push_back(std::get<Message>(std::move(*record)));
    } else {
      ++out.errors;
    }
  }
  return out;
}

Parsed parse_stream(const PlatformParser& parser, const std::string& text) {
  std::istringstream in(text);
  auto source = open_stream(parser, in);
  return collect(*source);
}

Parsed parse_text(const PlatformParser& parser, const std::string& text) {
  auto source = open_buffer(parser, text);
  return collect(*source);
}

Message make_message(const std::string& sender, int64_t ts, const std::string& text, uint64_t ordinal) {
  Message m;
  m.sender = sender;
  m.timestamp_ms = ts;
  m.text = text;
  m.span = SourceSpan{ordinal, ordinal};
  return m;
}

fs::path temp_path(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / "chatpack_tests";
  std::error_code ec;
  fs::create_directories(dir, ec);
  return dir / name;
}

fs::path write_fixture(const std::string& name, const std::string& content) {
  const fs::path p = temp_path(name);
  write_text_file(p, content);
  return p;
}

std::vector<std::vector<std::string>> parse_csv(const std::string& s) {
  std::vector<std::vector<std::string>> rows;
  std::vector<std::string> row;
  std::string field;
  bool quoted = false;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < s.size() && s[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          quoted = false;
        }
      } else {
        field.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      row.push_back(field);
      field.clear();
    } else if (c == '\n') {
      row.push_back(field);
      rows.push_back(row);
      row.clear();
      field.clear();
    } else {
      field.push_back(c);
    }
  }
  return rows;
}

const char* kWhatsAppChat =
    "15/01/2024, 10:30 - Alice: Hey\n"
    "15/01/2024, 10:31 - Alice: How are you?\n"
    "15/01/2024, 10:32 - Alice: See the project?\n"
    "15/01/2024, 10:33 - Bob: Yeah, looked\n"
    "15/01/2024, 10:34 - Bob: Pretty good\n";

const char* kTelegramExport = R"JSON({
  "name": "Chat",
  "type": "personal_chat",
  "id": 42,
  "messages": [
    {"id": 1, "type": "message", "date": "2024-01-15T10:30:00", "date_unixtime": "1705314600",
     "from": "Alice", "from_id": "user1", "text": "Hello"},
    {"id": 2, "type": "message", "date": "2024-01-15T10:31:00", "date_unixtime": "1705314660",
     "from": "Alice", "text": ["Check ", {"type": "bold", "text": "this"}, "out"]},
    {"id": 3, "type": "service", "date": "2024-01-15T10:32:00", "actor": "Bob",
     "action": "pin_message", "text": ""},
    {"id": 4, "type": "message", "date": "2024-01-15T10:33:00", "date_unixtime": "1705314780",
     "from": "Bob", "text": "Reply", "reply_to_message_id": 1,
     "edited": "2024-01-15T10:40:00", "edited_unixtime": "1705315200"},
    {"id": 5, "type": "message", "date": "2024-01-15T10:34:00", "from": "Carol",
     "forwarded_from": "Dave", "text": "", "photo": "photos/photo_1.jpg"},
    {"id": 6, "type": "weird", "date": "2024-01-15T10:35:00", "from": "Carol", "text": "x"}
  ]
})JSON";

const char* kInstagramExport = R"JSON({
  "participants": [{"name": "Alice"}, {"name": "Bob"}],
  "messages": [
    {"sender_name": "Bob", "timestamp_ms": 1705314660000, "content": "CafÃ© time",
     "photos": [{"uri": "messages/inbox/chat/photos/1.jpg", "creation_timestamp": 1}]},
    {"sender_name": "Alice", "timestamp_ms": 1705314600000, "content": "ð\u009f\u0098\u0080"},
    {"sender_name": "Alice", "content": "no timestamp"}
  ],
  "title": "Chat"
})JSON";

const char* kDiscordExport = R"JSON({
  "guild": {"id": "1", "name": "Guild"},
  "channel": {"id": "2", "name": "general"},
  "messages": [
    {"id": "1100000000000000001", "type": "Default", "timestamp": "2024-01-15T10:30:00.000+00:00",
     "timestampEdited": null, "content": "Hi all",
     "author": {"id": "9", "name": "alice", "nickname": "Alice"},
     "attachments": [{"id": "5", "url": "https://cdn.discordapp.com/attachments/1/2/cat.png", "fileName": "cat.png"}],
     "stickers": []},
    {"id": "1100000000000000002", "type": "Reply", "timestamp": "2024-01-15T12:31:00+02:00",
     "timestampEdited": "2024-01-15T10:35:00+00:00", "content": "Welcome",
     "author": {"id": "8", "name": "bob"}, "reference": {"messageId": "1100000000000000001"},
     "stickers": [{"id": "7", "name": "wave"}]},
    {"id": "1100000000000000003", "type": "ChannelPinnedMessage", "timestamp": "2024-01-15T10:32:00+00:00",
     "content": "", "author": {"id": "8", "name": "bob"}}
  ]
})JSON";

const char* kDiscrubExport = R"JSON([
  {"id": "1", "type": 0, "content": "yo", "timestamp": "2024-01-15T10:30:00+00:00",
   "author": {"username": "al", "global_name": "Al"},
   "attachments": [{"filename": "a.pdf", "url": "https://example.com/a.pdf"}]},
  {"id": "2", "type": 19, "content": "sup", "timestamp": "2024-01-15T10:31:00+00:00",
   "author": {"username": "bo"}, "message_reference": {"message_id": "1"},
   "sticker_items": [{"name": "hi"}]}
])JSON";

const char* kDiscordText =
    "==============================================================\n"
    "Guild: Guild\n"
    "Channel: general\n"
    "==============================================================\n"
    "\n"
    "[1/15/2024 10:30 AM] Alice\n"
    "Hello there\n"
    "second line\n"
    "\n"
    "[1/15/2024 10:31 AM] Bob (pinned)\n"
    "Look\n"
    "{Attachments}\n"
    "https://cdn.discordapp.com/attachments/1/2/photo.png?ex=1\n"
    "\n"
    "{Reactions}\n"
    "thumbsup (1)\n"
    "\n"
    "[1/15/2024 10:32 AM] Bob\n"
    "More\n"
    "\n"
    "==============================================================\n"
    "Exported 3 message(s)\n"
    "==============================================================\n";

int test_mojibake_repair() {
  // U+1F600 mangled twice, as in "Ã°ÂŸÂ˜Â€".
  const std::string twice = "\xC3\x83\xC2\xB0\xC3\x82\xC5\xB8\xC3\x82\xCB\x9C\xC3\x82\xE2\x82\xAC";
  const std::string emoji = "\xF0\x9F\x98\x80";
  EXPECT_EQ(repair_mojibake(twice), emoji);
  EXPECT_EQ(repair_mojibake("\xC3\xB0\xC2\x9F\xC2\x98\xC2\x80"), emoji);
  EXPECT_EQ(repair_mojibake("Caf\xC3\x83\xC2\xA9"), std::string("Caf\xC3\xA9"));

  EXPECT_EQ(repair_mojibake(emoji), emoji);
  EXPECT_EQ(repair_mojibake("Caf\xC3\xA9"), std::string("Caf\xC3\xA9"));
  EXPECT_EQ(repair_mojibake("plain ascii"), std::string("plain ascii"));
  EXPECT_EQ(repair_mojibake(""), std::string());
  EXPECT_EQ(repair_mojibake(repair_mojibake(twice)), repair_mojibake(twice));

  // Not UTF-8 at all: returned untouched.
  EXPECT_EQ(repair_mojibake("\xFF\xFE"), std::string("\xFF\xFE"));
  EXPECT_TRUE(looks_like_mojibake("Caf\xC3\x83\xC2\xA9"));
  EXPECT_TRUE(!looks_like_mojibake("Caf\xC3\xA9"));
  return 0;
}

int test_date_layout_detection() {
  EXPECT_TRUE(detect_date_layout({"15/01/2024, 10:30 - A: x"}) == DateLayout::kDayMonthYear);
  EXPECT_TRUE(detect_date_layout({"1/15/24, 10:30 AM - A: x"}) == DateLayout::kMonthDayYear);
  EXPECT_TRUE(detect_date_layout({"15.01.24, 10:30 - A: x"}) == DateLayout::kDayMonthYearDot);
  EXPECT_TRUE(detect_date_layout({"2024-01-15, 10:30 - A: x"}) == DateLayout::kIsoDate);
  EXPECT_TRUE(detect_date_layout({"[15/01/2024, 10:30:05] A: x"}) == DateLayout::kDayMonthYear);

  // No field above 12: the clock style decides.
  EXPECT_TRUE(detect_date_layout({"01/02/2024, 10:30 - A: x"}) == DateLayout::kDayMonthYear);
  EXPECT_TRUE(detect_date_layout({"01/02/24, 10:30 PM - A: x"}) == DateLayout::kMonthDayYear);

  // Evidence later in the sample wins over early ambiguous lines.
  EXPECT_TRUE(detect_date_layout({"01/02/24, 10:30 PM - A: x", "20/02/24, 10:31 PM - A: y",
                                  "21/02/24, 10:31 PM - A: z"}) == DateLayout::kDayMonthYear);

  EXPECT_TRUE(!detect_date_layout({"hello", "world"}).has_value());
  EXPECT_TRUE(!detect_date_layout({}).has_value());

  const auto h = split_header("1/15/24, 12:05 AM - Alice: hi");
  EXPECT_TRUE(h.has_value());
  EXPECT_EQ(h->rest, std::string("Alice: hi"));
  EXPECT_EQ(*header_timestamp(*h, DateLayout::kMonthDayYear), kJan15At1030 - 625 * kMinute);
  EXPECT_TRUE(!header_timestamp(*h, DateLayout::kDayMonthYear).has_value());

  const auto narrow = split_header("1/15/24, 10:30\xE2\x80\xAF" "PM - Bob: hey");
  EXPECT_TRUE(narrow.has_value());
  EXPECT_TRUE(narrow->pm);
  EXPECT_EQ(*header_timestamp(*narrow, DateLayout::kMonthDayYear), kJan15At1030 + 12 * 60 * kMinute);
  return 0;
}

int test_whatsapp_parser() {
  const PlatformParser parser = WhatsAppParser{};
  {
    const Parsed p = parse_stream(parser, kWhatsAppChat);
    EXPECT_EQ(p.messages.size(), 5u);
    EXPECT_EQ(p.errors, 0u);
    EXPECT_EQ(p.messages[0].sender, std::string("Alice"));
    EXPECT_EQ(p.messages[0].text, std::string("Hey"));
    EXPECT_EQ(p.messages[0].timestamp_ms, kJan15At1030);
    EXPECT_EQ(p.messages[3].text, std::string("Yeah, looked"));

    const auto merged = merge_consecutive(p.messages);
    EXPECT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].sender, std::string("Alice"));
    EXPECT_EQ(merged[0].text, std::string("Hey | How are you? | See the project?"));
    EXPECT_EQ(merged[0].timestamp_ms, kJan15At1030);
    EXPECT_EQ(merged[1].sender, std::string("Bob"));
    EXPECT_EQ(merged[1].text, std::string("Yeah, looked | Pretty good"));
  }

  const std::string ios =
      "\xEF\xBB\xBF[1/15/24, 10:30:05 AM] Alice: first line\r\n"
      "second line\r\n"
      "[1/15/24, 10:31:00 AM] Alice added Bob\r\n"
      "[1/15/24, 10:32:00 PM] Bob: <Media omitted>\r\n";
  {
    const Parsed p = parse_stream(parser, ios);
    EXPECT_EQ(p.messages.size(), 2u);
    EXPECT_EQ(p.messages[0].text, std::string("first line\nsecond line"));
    EXPECT_EQ(p.messages[0].timestamp_ms, kJan15At1030 + 5000);
    EXPECT_EQ(p.messages[1].sender, std::string("Bob"));
    EXPECT_EQ(p.messages[1].text, std::string());
    EXPECT_EQ(p.messages[1].attachments.size(), 1u);
    EXPECT_EQ(p.messages[1].attachments[0].kind, std::string("media"));
    EXPECT_EQ(p.messages[1].timestamp_ms, kJan15At1030 + 722 * kMinute);
  }
  {
    const PlatformParser with_system = WhatsAppParser{ParserOptions{true}};
    const Parsed p = parse_stream(with_system, ios);
    EXPECT_EQ(p.messages.size(), 3u);
    EXPECT_TRUE(p.messages[1].is_service());
    EXPECT_EQ(p.messages[1].sender, std::string("System"));
    EXPECT_EQ(p.messages[1].text, std::string("Alice added Bob"));
  }
  {
    // An impossible date is one bad record; it also breaks the merge run.
    const Parsed p = parse_text(parser,
                                "15/01/2024, 10:00 - Alice: one\n"
                                "31/02/2024, 10:00 - Alice: bad\n"
                                "16/01/2024, 10:00 - Alice: two\n");
    EXPECT_EQ(p.messages.size(), 2u);
    EXPECT_EQ(p.errors, 1u);
    EXPECT_EQ(merge_consecutive(p.messages).size(), 2u);
  }
  {
    // Notices quoting text with ": " stay system lines.
    const std::string notices =
        "15/01/2024, 10:30 - Alice changed the subject from \"Trip\" to \"Trip: day 1\"\n"
        "15/01/2024, 10:31 - Bob changed the group description\n"
        "15/01/2024, 10:32 - Alice: we changed the subject: sorry\n";
    const Parsed hidden = parse_stream(parser, notices);
    EXPECT_EQ(hidden.messages.size(), 1u);
    EXPECT_EQ(hidden.messages[0].sender, std::string("Alice"));
    EXPECT_EQ(hidden.messages[0].text, std::string("we changed the subject: sorry"));

    const PlatformParser with_system = WhatsAppParser{ParserOptions{true}};
    const Parsed all = parse_stream(with_system, notices);
    EXPECT_EQ(all.messages.size(), 3u);
    EXPECT_TRUE(all.messages[0].is_service());
    EXPECT_EQ(all.messages[0].sender, std::string("System"));
    EXPECT_EQ(all.messages[0].text, std::string("Alice changed the subject from \"Trip\" to \"Trip: day 1\""));
    EXPECT_TRUE(all.messages[1].is_service());
    EXPECT_TRUE(!all.messages[2].is_service());
  }
  EXPECT_THROW(parse_stream(parser, "just text\nno headers here\n"), FileFatalError);
  EXPECT_THROW(parse_stream(parser, ""), FileFatalError);
  EXPECT_THROW(parse_text(parser, "\n\n"), FileFatalError);
  return 0;
}

int test_telegram_parser() {
  const PlatformParser parser = TelegramParser{};
  const Parsed p = parse_stream(parser, kTelegramExport);
  EXPECT_EQ(p.messages.size(), 4u);
  EXPECT_EQ(p.errors, 1u);

  EXPECT_EQ(*p.messages[0].id, 1u);
  EXPECT_EQ(p.messages[0].sender, std::string("Alice"));
  EXPECT_EQ(p.messages[0].text, std::string("Hello"));
  EXPECT_EQ(p.messages[0].timestamp_ms, kJan15At1030);

  EXPECT_EQ(p.messages[1].text, std::string("Check this out"));

  EXPECT_EQ(p.messages[2].sender, std::string("Bob"));
  EXPECT_EQ(*p.messages[2].reply_to, 1u);
  EXPECT_EQ(*p.messages[2].edited_ms, kJan15At1030 + 10 * kMinute);

  EXPECT_EQ(*p.messages[3].forwarded_from, std::string("Dave"));
  EXPECT_EQ(p.messages[3].timestamp_ms, kJan15At1030 + 4 * kMinute);
  EXPECT_EQ(p.messages[3].attachments.size(), 1u);
  EXPECT_EQ(p.messages[3].attachments[0].kind, std::string("photo"));
  EXPECT_EQ(p.messages[3].attachments[0].name, std::string("photo_1.jpg"));

  // Deterministic, and identical between streamed and buffered input.
  const Parsed again = parse_stream(parser, kTelegramExport);
  EXPECT_TRUE(again.messages == p.messages);
  const Parsed buffered = parse_text(parser, kTelegramExport);
  EXPECT_TRUE(buffered.messages == p.messages);
  EXPECT_EQ(buffered.errors, p.errors);

  const auto merged = merge_consecutive(p.messages);
  EXPECT_EQ(merged.size(), 3u);
  EXPECT_EQ(merged[0].text, std::string("Hello | Check this out"));
  EXPECT_EQ(*merged[0].id, 1u);

  const PlatformParser with_system = TelegramParser{ParserOptions{true}};
  const Parsed all = parse_stream(with_system, kTelegramExport);
  EXPECT_EQ(all.messages.size(), 5u);
  EXPECT_TRUE(all.messages[2].is_service());
  EXPECT_EQ(all.messages[2].sender, std::string("Bob"));
  EXPECT_EQ(all.messages[2].text, std::string("pin_message"));

  EXPECT_THROW(parse_stream(parser, ""), FileFatalError);
  EXPECT_THROW(parse_stream(parser, "not json"), FileFatalError);
  EXPECT_THROW(parse_stream(parser, "[1, 2]"), FileFatalError);
  EXPECT_THROW(parse_stream(parser, R"({"name": "x"})"), FileFatalError);
  EXPECT_THROW(parse_stream(parser, R"({"messages": 5})"), FileFatalError);
  EXPECT_THROW(parse_stream(parser, R"({"messages": [{"id": 1,)"), FileFatalError);
  EXPECT_THROW(parse_text(parser, R"({"messages": [{"id": 1,)"), FileFatalError);
  EXPECT_THROW(parse_text(parser, "   "), FileFatalError);

  // Whatever follows the message array must still be well-formed JSON.
  const std::string one =
      R"({"id": 1, "type": "message", "date_unixtime": "1705314600", "from": "Alice", "text": "hi"})";
  const std::vector<std::string> broken = {
      R"({"messages": [)" + one + "]",
      R"({"messages": [)" + one + R"(], "x": garbage})",
      R"({"messages": [)" + one + R"(], "x": 1)",
      R"({"messages": [)" + one + R"(]} trailing)",
      R"({"messages": [)" + one + R"(], })",
  };
  for (const auto& doc : broken) {
    EXPECT_THROW(parse_stream(parser, doc), FileFatalError);
    EXPECT_THROW(parse_text(parser, doc), FileFatalError);
  }
  const std::string trailing_members =
      R"({"messages": [)" + one + R"(], "extra": {"a": [1, "]}"]}, "n": null}  )" + "\n";
  EXPECT_EQ(parse_stream(parser, trailing_members).messages.size(), 1u);
  EXPECT_EQ(parse_text(parser, trailing_members).messages.size(), 1u);

  // Seconds beyond what fits in milliseconds make the record bad, not a wrapped date.
  {
    const Parsed huge = parse_stream(parser, R"({"messages": [
      {"id": 1, "type": "message", "date": "2024-01-15T10:30:00", "date_unixtime": "18446744073709551",
       "from": "Alice", "text": "a"},
      {"id": 2, "type": "message", "date": 18446744073709551, "from": "Alice", "text": "b"},
      {"id": 3, "type": "message", "date": -9223372036854776, "from": "Alice", "text": "c"},
      {"id": 4, "type": "message", "date": 1705314600, "from": "Alice", "text": "d",
       "edited_unixtime": "18446744073709551"}]})");
    EXPECT_EQ(huge.errors, 3u);
    EXPECT_EQ(huge.messages.size(), 1u);
    EXPECT_EQ(huge.messages[0].timestamp_ms, kJan15At1030);
    EXPECT_TRUE(!huge.messages[0].edited_ms.has_value());
  }
  return 0;
}

int test_instagram_parser() {
  const PlatformParser parser = InstagramParser{};
  const Parsed p = parse_stream(parser, kInstagramExport);
  EXPECT_EQ(p.messages.size(), 2u);
  EXPECT_EQ(p.errors, 1u);
  EXPECT_EQ(p.messages[0].sender, std::string("Bob"));
  EXPECT_EQ(p.messages[0].text, std::string("Caf\xC3\xA9 time"));
  EXPECT_EQ(p.messages[0].attachments.size(), 1u);
  EXPECT_EQ(p.messages[0].attachments[0].kind, std::string("photo"));
  EXPECT_EQ(p.messages[0].attachments[0].name, std::string("1.jpg"));
  EXPECT_EQ(p.messages[1].text, std::string("\xF0\x9F\x98\x80"));
  EXPECT_EQ(p.messages[1].timestamp_ms, kJan15At1030);

  const Parsed buffered = parse_text(parser, kInstagramExport);
  EXPECT_TRUE(buffered.messages == p.messages);
  return 0;
}

int test_discord_parser() {
  const PlatformParser parser = DiscordParser{};
  {
    const Parsed p = parse_stream(parser, kDiscordExport);
    EXPECT_EQ(p.messages.size(), 2u);
    EXPECT_EQ(p.errors, 0u);
    EXPECT_EQ(p.messages[0].sender, std::string("Alice"));
    EXPECT_EQ(*p.messages[0].id, 1100000000000000001ULL);
    EXPECT_EQ(p.messages[0].attachments.size(), 1u);
    EXPECT_EQ(p.messages[0].attachments[0].kind, std::string("photo"));
    EXPECT_EQ(p.messages[0].attachments[0].name, std::string("cat.png"));
    EXPECT_TRUE(!p.messages[0].edited_ms.has_value());

    EXPECT_EQ(p.messages[1].sender, std::string("bob"));
    EXPECT_EQ(p.messages[1].timestamp_ms, kJan15At1030 + kMinute);
    EXPECT_EQ(*p.messages[1].reply_to, 1100000000000000001ULL);
    EXPECT_EQ(*p.messages[1].edited_ms, kJan15At1030 + 5 * kMinute);
    EXPECT_EQ(p.messages[1].attachments[0].kind, std::string("sticker"));
    EXPECT_EQ(p.messages[1].attachments[0].name, std::string("wave"));

    EXPECT_TRUE(parse_stream(parser, kDiscordExport).messages == p.messages);
    EXPECT_TRUE(parse_text(parser, kDiscordExport).messages == p.messages);

    const Parsed all = parse_stream(DiscordParser{ParserOptions{true}}, kDiscordExport);
    EXPECT_EQ(all.messages.size(), 3u);
    EXPECT_TRUE(all.messages[2].is_service());
    EXPECT_EQ(all.messages[2].text, std::string("ChannelPinnedMessage"));
  }
  {
    const Parsed p = parse_stream(parser, kDiscrubExport);
    EXPECT_EQ(p.messages.size(), 2u);
    EXPECT_EQ(p.messages[0].sender, std::string("Al"));
    EXPECT_EQ(p.messages[0].attachments[0].kind, std::string("file"));
    EXPECT_EQ(p.messages[0].attachments[0].name, std::string("a.pdf"));
    EXPECT_EQ(p.messages[1].sender, std::string("bo"));
    EXPECT_EQ(*p.messages[1].reply_to, 1u);
    EXPECT_EQ(p.messages[1].attachments[0].name, std::string("hi"));
    EXPECT_TRUE(parse_text(parser, kDiscrubExport).messages == p.messages);
  }
  {
    const Parsed p = parse_stream(parser, kDiscordText);
    EXPECT_EQ(p.messages.size(), 3u);
    EXPECT_EQ(p.messages[0].sender, std::string("Alice"));
    EXPECT_EQ(p.messages[0].text, std::string("Hello there\nsecond line"));
    EXPECT_EQ(p.messages[0].timestamp_ms, kJan15At1030);
    EXPECT_EQ(p.messages[1].sender, std::string("Bob"));
    EXPECT_EQ(p.messages[1].text, std::string("Look"));
    EXPECT_EQ(p.messages[1].attachments.size(), 1u);
    EXPECT_EQ(p.messages[1].attachments[0].name, std::string("photo.png"));
    EXPECT_EQ(p.messages[2].text, std::string("More"));
    EXPECT_TRUE(parse_text(parser, kDiscordText).messages == p.messages);

    const auto merged = merge_consecutive(p.messages);
    EXPECT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[1].text, std::string("Look | More"));
  }
  EXPECT_THROW(parse_stream(parser, "  \n "), FileFatalError);
  EXPECT_THROW(parse_stream(parser, "no headers in here\n"), FileFatalError);
  return 0;
}

int test_platform_dispatch() {
  EXPECT_TRUE(parse_platform("tg") == Platform::kTelegram);
  EXPECT_TRUE(parse_platform("Telegram") == Platform::kTelegram);
  EXPECT_TRUE(parse_platform("WA") == Platform::kWhatsApp);
  EXPECT_TRUE(parse_platform("instagram") == Platform::kInstagram);
  EXPECT_TRUE(parse_platform("dc") == Platform::kDiscord);
  EXPECT_THROW(parse_platform("slack"), ConfigError);

  EXPECT_TRUE(parse_format("JSON") == OutputFormat::kJson);
  EXPECT_TRUE(parse_format("ndjson") == OutputFormat::kJsonl);
  EXPECT_THROW(parse_format("xml"), ConfigError);
  EXPECT_EQ(default_output_path(OutputFormat::kJsonl), std::string("optimized_chat.jsonl"));

  const PlatformParser parser = make_parser(Platform::kWhatsApp, ParserOptions{});
  EXPECT_TRUE(std::holds_alternative<WhatsAppParser>(parser));
  return 0;
}

int test_filter() {
  const int64_t day = *parse_date("2024-01-15");
  std::vector<Message> messages = {
      make_message("Alice", day - 1, "before", 0),
      make_message("Alice", day, "first ms", 1),
      make_message("Bob", day + kMsPerDay - 1, "last ms", 2),
      make_message("Bob", day + kMsPerDay, "after", 3),
  };
  FilterConfig one_day;
  one_day.with_date_from("2024-01-15").with_date_to("2024-01-15");
  const auto kept = filter_messages(messages, one_day);
  EXPECT_EQ(kept.size(), 2u);
  EXPECT_EQ(kept[0].text, std::string("first ms"));
  EXPECT_EQ(kept[1].text, std::string("last ms"));

  std::vector<Message> chat = {
      make_message("Alice", 1, "a1", 0), make_message("Bob", 2, "b1", 1),   make_message("Alice", 3, "a2", 2),
      make_message("Bob", 4, "b2", 3),   make_message("Alice", 5, "a3", 4),
  };
  FilterConfig from_alice;
  from_alice.with_sender("Alice");
  const auto alice = filter_messages(chat, from_alice);
  EXPECT_EQ(alice.size(), 3u);
  for (const auto& m : alice) {
    EXPECT_EQ(m.sender, std::string("Alice"));
  }
  FilterConfig lowercase;
  lowercase.with_sender("alice");
  EXPECT_EQ(filter_messages(chat, lowercase).size(), 0u);

  // Filtered-out neighbours must not be merged across.
  EXPECT_EQ(merge_consecutive(alice).size(), 3u);

  FilterConfig bad;
  EXPECT_THROW(bad.with_date_from("2024-13-01"), ConfigError);
  EXPECT_THROW(bad.with_date_to("15/01/2024"), ConfigError);
  EXPECT_TRUE(!FilterConfig{}.is_active());
  return 0;
}

int test_merge() {
  {
    std::vector<Message> run = {make_message("Alice", 1000, "x", 0), make_message("Alice", 2000, "", 1),
                                make_message("Alice", 3000, "z", 2)};
    run[0].id = 10;
    run[0].edited_ms = 5000;
    run[0].reply_to = 3;
    run[0].attachments.push_back(Attachment{"photo", "a.jpg", ""});
    run[1].id = 11;
    run[1].edited_ms = 9000;
    run[1].attachments.push_back(Attachment{"video", "b.mp4", ""});
    run[2].reply_to = 99;

    const auto merged = merge_consecutive(run);
    EXPECT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].text, std::string("x | z"));
    EXPECT_EQ(merged[0].timestamp_ms, 1000);
    EXPECT_TRUE(!merged[0].id.has_value());
    EXPECT_EQ(*merged[0].edited_ms, 9000);
    EXPECT_EQ(*merged[0].reply_to, 3u);
    EXPECT_EQ(merged[0].attachments.size(), 2u);
    EXPECT_EQ(merged[0].attachments[1].kind, std::string("video"));
    EXPECT_EQ(merged[0].span->first, 0u);
    EXPECT_EQ(merged[0].span->last, 2u);
  }
  {
    std::vector<Message> gap = {make_message("Alice", 1, "a", 0), make_message("Alice", 2, "b", 2)};
    EXPECT_EQ(merge_consecutive(gap).size(), 2u);
    MergeOptions adjacency;
    adjacency.consecutive_only = false;
    adjacency.separator = "\n";
    const auto merged = merge_consecutive(gap, adjacency);
    EXPECT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].text, std::string("a\nb"));
  }
  {
    std::vector<Message> service = {make_message("System", 1, "x joined", 0),
                                    make_message("System", 2, "y joined", 1)};
    service[0].kind = MessageKind::kService;
    service[1].kind = MessageKind::kService;
    EXPECT_EQ(merge_consecutive(service).size(), 2u);
  }
  {
    std::vector<Message> mixed = {
        make_message("A", 1, "1", 0), make_message("A", 2, "2", 1), make_message("B", 3, "3", 2),
        make_message("A", 4, "4", 3), make_message("A", 5, "5", 5), make_message("A", 6, "6", 6),
    };
    const auto once = merge_consecutive(mixed);
    EXPECT_EQ(once.size(), 4u);
    EXPECT_TRUE(merge_consecutive(once) == once);
    for (std::size_t i = 1; i < once.size(); ++i) {
      const bool same_sender = once[i - 1].sender == once[i].sender;
      EXPECT_TRUE(!same_sender || once[i - 1].span->last + 1 != once[i].span->first);
    }
  }
  {
    // Newest-first exports: the run still starts at its earliest message.
    std::vector<Message> newest_first = {make_message("Alice", kJan15At1030 + 2 * kMinute, "c", 0),
                                         make_message("Alice", kJan15At1030 + kMinute, "b", 1),
                                         make_message("Alice", kJan15At1030, "a", 2)};
    const auto merged = merge_consecutive(newest_first);
    EXPECT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].timestamp_ms, kJan15At1030);
    EXPECT_EQ(merged[0].text, std::string("c | b | a"));

    const PlatformParser instagram = InstagramParser{};
    const Parsed p = parse_stream(instagram, R"JSON({"messages": [
      {"sender_name": "Alice", "timestamp_ms": 1705314720000, "content": "three"},
      {"sender_name": "Alice", "timestamp_ms": 1705314660000, "content": "two"},
      {"sender_name": "Alice", "timestamp_ms": 1705314600000, "content": "one"}]})JSON");
    const auto folded = merge_consecutive(p.messages);
    EXPECT_EQ(folded.size(), 1u);
    EXPECT_EQ(folded[0].timestamp_ms, kJan15At1030);
  }
  EXPECT_EQ(merge_consecutive({}).size(), 0u);
  return 0;
}

int test_csv_writer() {
  std::vector<Message> messages = {
      make_message("Alice", kJan15At1030, "He said \"hi\", then left", 0),
      make_message("Bob, Jr.", kJan15At1030 + kMinute, "line1\nline2", 1),
      make_message("Carol", kJan15At1030 + 2 * kMinute, "plain", 2),
  };
  messages[1].attachments.push_back(Attachment{"photo", "cat.png", ""});
  messages[1].attachments.push_back(Attachment{"sticker", "", ""});

  std::ostringstream out;
  FieldSelection fields;
  fields.timestamps = true;
  fields.attachments = true;
  CsvWriter writer(out, fields);
  writer.begin();
  for (const auto& m : messages) {
    writer.write(m);
  }
  writer.finish();
  EXPECT_EQ(writer.written(), 3u);

  const auto rows = parse_csv(out.str());
  EXPECT_EQ(rows.size(), 4u);
  EXPECT_EQ(rows[0].size(), 4u);
  EXPECT_EQ(rows[0][0], std::string("Timestamp"));
  EXPECT_EQ(rows[0][3], std::string("Attachments"));
  EXPECT_EQ(rows[1][0], std::string("2024-01-15 10:30:00"));
  EXPECT_EQ(rows[1][2], messages[0].text);
  EXPECT_EQ(rows[2][1], messages[1].sender);
  EXPECT_EQ(rows[2][2], messages[1].text);
  EXPECT_EQ(rows[2][3], std::string("photo:cat.png; sticker"));
  EXPECT_EQ(rows[3][2], std::string("plain"));

  std::ostringstream minimal;
  CsvWriter bare(minimal, FieldSelection{});
  bare.begin();
  bare.write(messages[2]);
  bare.finish();
  EXPECT_EQ(minimal.str(), std::string("Sender,Content\nCarol,plain\n"));

  std::ostringstream semi;
  CsvWriter semicolon(semi, FieldSelection{}, ';');
  EXPECT_EQ(semicolon.escape("a;b"), std::string("\"a;b\""));
  EXPECT_EQ(semicolon.escape("a,b"), std::string("a,b"));
  return 0;
}

int test_json_writers() {
  std::vector<Message> messages = {make_message("Alice", kJan15At1030, "Hey", 0),
                                   make_message("Bob", kJan15At1030 + kMinute, "Yo", 1)};
  messages[1].id = 5;
  messages[1].reply_to = 3;
  messages[1].forwarded_from = "Dave";
  messages[1].edited_ms = kJan15At1030 + 2 * kMinute;

  {
    std::ostringstream out;
    JsonWriter writer(out, FieldSelection{});
    writer.begin();
    writer.write(messages[0]);
    writer.finish();
    EXPECT_EQ(out.str(), std::string("[\n{\"sender\":\"Alice\",\"content\":\"Hey\"}\n]\n"));
  }
  {
    std::ostringstream out;
    JsonWriter writer(out, FieldSelection{});
    writer.begin();
    writer.finish();
    EXPECT_EQ(out.str(), std::string("[]\n"));
  }
  {
    std::ostringstream out;
    FieldSelection all{true, true, true, true, true};
    JsonWriter writer(out, all, true);
    writer.begin();
    for (const auto& m : messages) {
      writer.write(m);
    }
    writer.finish();
    const json doc = json::parse(out.str());
    EXPECT_TRUE(doc.is_array());
    EXPECT_EQ(doc.size(), 2u);
    EXPECT_EQ(doc[1]["timestamp"].get<std::string>(), std::string("2024-01-15 10:31:00"));
    EXPECT_EQ(doc[1]["edited"].get<std::string>(), std::string("2024-01-15 10:32:00"));
    EXPECT_EQ(doc[1]["forwarded_from"].get<std::string>(), std::string("Dave"));
    EXPECT_TRUE(!doc[0].contains("id"));
    EXPECT_TRUE(!doc[0].contains("attachments"));
  }
  {
    std::ostringstream out;
    FieldSelection fields;
    fields.ids = true;
    fields.replies = true;
    JsonlWriter writer(out, fields);
    writer.begin();
    for (const auto& m : messages) {
      writer.write(m);
    }
    writer.finish();
    EXPECT_EQ(out.str(), std::string("{\"sender\":\"Alice\",\"content\":\"Hey\"}\n"
                                     "{\"id\":5,\"sender\":\"Bob\",\"content\":\"Yo\",\"reply_to\":3,"
                                     "\"forwarded_from\":\"Dave\"}\n"));
  }
  {
    // Invalid UTF-8 is replaced rather than aborting the write.
    std::ostringstream out;
    JsonlWriter writer(out, FieldSelection{});
    writer.write(make_message("A", 0, "bad \xFF byte", 0));
    EXPECT_TRUE(json::parse(out.str()).is_object());
  }
  return 0;
}

int test_pipeline() {
  struct Case {
    Platform platform;
    std::string fixture;
    OutputFormat format;
  };
  const std::vector<Case> cases = {
      {Platform::kWhatsApp, kWhatsAppChat, OutputFormat::kCsv},
      {Platform::kTelegram, kTelegramExport, OutputFormat::kJson},
      {Platform::kInstagram, kInstagramExport, OutputFormat::kJsonl},
      {Platform::kDiscord, kDiscordExport, OutputFormat::kCsv},
      {Platform::kDiscord, kDiscordText, OutputFormat::kJson},
  };
  int n = 0;
  for (const auto& c : cases) {
    const fs::path input = write_fixture("input_" + std::to_string(n), c.fixture);
    Config cfg;
    cfg.output.format = c.format;
    cfg.output.fields = FieldSelection{true, true, true, true, true};

    cfg.output.path = temp_path("stream_" + std::to_string(n)).string();
    const Metrics streamed = run_pipeline(c.platform, input, cfg);
    cfg.pipeline.streaming = false;
    cfg.output.path = temp_path("buffered_" + std::to_string(n)).string();
    const Metrics buffered = run_pipeline(c.platform, input, cfg);

    EXPECT_EQ(read_text_file(temp_path("stream_" + std::to_string(n))),
              read_text_file(temp_path("buffered_" + std::to_string(n))));
    EXPECT_EQ(streamed.get("written"), buffered.get("written"));
    EXPECT_EQ(streamed.get("parse_errors"), buffered.get("parse_errors"));
    ++n;
  }

  {
    const fs::path input = write_fixture("wa_chat.txt", kWhatsAppChat);
    Config cfg;
    cfg.output.path = temp_path("wa_out.csv").string();
    const Metrics m = run_pipeline(Platform::kWhatsApp, input, cfg);
    EXPECT_EQ(m.get("parsed"), 5u);
    EXPECT_EQ(m.get("merged_away"), 3u);
    EXPECT_EQ(m.get("written"), 2u);
    EXPECT_EQ(read_text_file(cfg.output.path),
              std::string("Sender,Content\n"
                          "Alice,Hey | How are you? | See the project?\n"
                          "Bob,\"Yeah, looked | Pretty good\"\n"));

    cfg.pipeline.merge = false;
    cfg.filter.with_sender("Bob");
    const Metrics f = run_pipeline(Platform::kWhatsApp, input, cfg);
    EXPECT_EQ(f.get("filtered_out"), 3u);
    EXPECT_EQ(f.get("written"), 2u);
  }

  {
    const fs::path input = write_fixture("tg_export.json", kTelegramExport);
    Config cfg;
    cfg.output.path = temp_path("tg_strict.csv").string();
    cfg.pipeline.strict = true;
    EXPECT_THROW(run_pipeline(Platform::kTelegram, input, cfg), FileFatalError);

    cfg.pipeline.strict = false;
    uint64_t calls = 0;
    cfg.pipeline.progress_interval = 2;
    const Metrics m = run_pipeline(Platform::kTelegram, input, cfg, [&calls](uint64_t) { ++calls; });
    EXPECT_EQ(m.get("parse_errors"), 1u);
    EXPECT_EQ(calls, 2u);
  }

  // A file-level error leaves no output file behind.
  for (const bool streaming : {true, false}) {
    const fs::path out = temp_path("never_created.csv");
    std::error_code ec;
    fs::remove(out, ec);
    Config cfg;
    cfg.output.path = out.string();
    cfg.pipeline.streaming = streaming;

    EXPECT_THROW(run_pipeline(Platform::kTelegram, write_fixture("bad.json", "not json"), cfg), FileFatalError);
    EXPECT_TRUE(!fs::exists(out));
    EXPECT_THROW(run_pipeline(Platform::kWhatsApp, write_fixture("bad.txt", "no header\n"), cfg), FileFatalError);
    EXPECT_TRUE(!fs::exists(out));
    EXPECT_THROW(run_pipeline(Platform::kInstagram, write_fixture("empty.json", ""), cfg), FileFatalError);
    EXPECT_TRUE(!fs::exists(out));
    EXPECT_THROW(run_pipeline(Platform::kTelegram, temp_path("does_not_exist.json"), cfg), FileFatalError);
    EXPECT_TRUE(!fs::exists(out));

    // Damage after the message array is found only once records were written.
    const std::string tg = kTelegramExport;
    const std::string unclosed = tg.substr(0, tg.rfind('}'));
    EXPECT_THROW(run_pipeline(Platform::kTelegram, write_fixture("unclosed.json", unclosed), cfg), FileFatalError);
    EXPECT_TRUE(!fs::exists(out));
    EXPECT_THROW(run_pipeline(Platform::kTelegram, write_fixture("garbage.json", unclosed + R"(, "x": garbage})"), cfg),
                 FileFatalError);
    EXPECT_TRUE(!fs::exists(out));
    EXPECT_THROW(run_pipeline(Platform::kDiscord, write_fixture("discrub_tail.json", std::string(kDiscrubExport) + "]"),
                              cfg),
                 FileFatalError);
    EXPECT_TRUE(!fs::exists(out));
  }

  {
    const fs::path input = write_fixture("wa_bad_date.txt",
                                         "15/01/2024, 10:00 - Alice: one\n"
                                         "31/02/2024, 10:00 - Alice: bad\n");
    Config cfg;
    cfg.output.path = temp_path("wa_bad_date.csv").string();
    cfg.pipeline.quiet = true;
    const Metrics m = run_pipeline(Platform::kWhatsApp, input, cfg);
    EXPECT_EQ(m.get("parse_errors"), 1u);
    const auto note = skipped_records_note(m);
    EXPECT_TRUE(note.has_value());
    EXPECT_EQ(*note, std::string("skipped 1 malformed record"));
    EXPECT_TRUE(!skipped_records_note(Metrics{}).has_value());
  }

  {
    const fs::path input = write_fixture("wa_chat2.txt", kWhatsAppChat);
    Config cfg;
    cfg.output.path = (temp_path("missing_dir") / "nested" / "out.csv").string();
    EXPECT_THROW(run_pipeline(Platform::kWhatsApp, input, cfg), OutputIOError);
  }
  return 0;
}

int test_config() {
  {
    Config cfg;
    apply_config_json(default_config_json(), cfg);
    EXPECT_TRUE(cfg.pipeline.merge);
    EXPECT_TRUE(cfg.pipeline.streaming);
    EXPECT_TRUE(cfg.output.format == OutputFormat::kCsv);
    EXPECT_EQ(cfg.pipeline.merge_separator, std::string(" | "));
    EXPECT_EQ(cfg.pipeline.progress_interval, 10000u);
    EXPECT_TRUE(!cfg.filter.is_active());
  }
  {
    json root = default_config_json();
    root["output"]["format"] = "jsonl";
    root["output"]["csvDelimiter"] = ";";
    root["pipeline"]["mergeSeparator"] = " / ";
    root["filter"]["from"] = "Alice";
    root["filter"]["after"] = "2024-01-15";
    Config cfg;
    apply_config_json(root, cfg);
    EXPECT_TRUE(cfg.output.format == OutputFormat::kJsonl);
    EXPECT_EQ(cfg.output.csv_delimiter, ';');
    EXPECT_EQ(cfg.pipeline.merge_separator, std::string(" / "));
    EXPECT_EQ(*cfg.filter.sender, std::string("Alice"));
    EXPECT_EQ(*cfg.filter.date_from_ms, kJan15At1030 - 630 * kMinute);
    EXPECT_EQ(cfg.output.resolved_path(), std::string("optimized_chat.jsonl"));
  }
  {
    json root = default_config_json();
    root["output"]["format"] = "xml";
    Config cfg;
    EXPECT_THROW(apply_config_json(root, cfg), ConfigError);
  }
  {
    const fs::path path = temp_path("config.json");
    EXPECT_TRUE(save_default_config(path));
    const Config loaded = load_config(path);
    EXPECT_TRUE(loaded.pipeline.merge);

    write_text_file(path, "{ not json");
    const Config fallback = load_config(path);
    EXPECT_TRUE(fallback.pipeline.streaming);

    write_text_file(path, R"({"pipeline": {"merge": false}, "output": {"format": "nope"}})");
    EXPECT_TRUE(load_config(path).pipeline.merge);

    write_text_file(path, R"({"pipeline": {"merge": false, "strict": true}})");
    const Config custom = load_config(path);
    EXPECT_TRUE(!custom.pipeline.merge);
    EXPECT_TRUE(custom.pipeline.strict);

    EXPECT_TRUE(load_config(temp_path("no_such_config.json")).pipeline.merge);
  }
  return 0;
}

}  // namespace

int main() {
  using namespace chatpack;
  Logger::set_min_level(Logger::Level::kError);

  if (test_mojibake_repair() != 0) return 1;
  if (test_date_layout_detection() != 0) return 1;
  if (test_whatsapp_parser() != 0) return 1;
  if (test_telegram_parser() != 0) return 1;
  if (test_instagram_parser() != 0) return 1;
  if (test_discord_parser() != 0) return 1;
  if (test_platform_dispatch() != 0) return 1;
  if (test_filter() != 0) return 1;
  if (test_merge() != 0) return 1;
  if (test_csv_writer() != 0) return 1;
  if (test_json_writers() != 0) return 1;
  if (test_pipeline() != 0) return 1;
  if (test_config() != 0) return 1;

  std::cout << "OK\n";
  return 0;
}
