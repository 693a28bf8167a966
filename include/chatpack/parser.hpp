#pragma once

#include <memory>
#include <string>
#include <variant>

#include "chatpack/discord_parser.hpp"
#include "chatpack/instagram_parser.hpp"
#include "chatpack/telegram_parser.hpp"
#include "chatpack/whatsapp_parser.hpp"

namespace chatpack {

enum class Platform { kTelegram, kWhatsApp, kInstagram, kDiscord };

inline const char* platform_name(Platform p) {
  switch (p) {
    case Platform::kTelegram:
      return "Telegram";
    case Platform::kWhatsApp:
      return "WhatsApp";
    case Platform::kInstagram:
      return "Instagram";
    case Platform::kDiscord:
    default:
      return "Discord";
  }
}

inline Platform parse_platform(const std::string& raw) {
  const std::string name = to_lower(trim(raw));
  if (name == "tg" || name == "telegram") return Platform::kTelegram;
  if (name == "wa" || name == "whatsapp") return Platform::kWhatsApp;
  if (name == "ig" || name == "instagram") return Platform::kInstagram;
  if (name == "dc" || name == "discord") return Platform::kDiscord;
  throw ConfigError("Unknown source '" + raw + "': expected tg|telegram, wa|whatsapp, ig|instagram, dc|discord");
}

using PlatformParser = std::variant<TelegramParser, WhatsAppParser, InstagramParser, DiscordParser>;

inline PlatformParser make_parser(Platform platform, const ParserOptions& options) {
  switch (platform) {
    case Platform::kTelegram:
      return TelegramParser{options};
    case Platform::kWhatsApp:
      return WhatsAppParser{options};
    case Platform::kInstagram:
      return InstagramParser{options};
    case Platform::kDiscord:
    default:
      return DiscordParser{options};
  }
}

// Streaming: `in` must outlive the returned source.
inline std::unique_ptr<RecordSource> open_stream(const PlatformParser& parser, std::istream& in) {
  return std::visit([&in](const auto& p) { return p.stream(in); }, parser);
}

inline std::unique_ptr<RecordSource> open_buffer(const PlatformParser& parser, const std::string& text) {
  return std::visit([&text](const auto& p) { return p.parse_buffer(text); }, parser);
}

}  // namespace chatpack
