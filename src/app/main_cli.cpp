#include <charconv>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/model/app_meta.hpp"
#include "core/protocol/invite_codec.hpp"
#include "core/util/canonical.hpp"

namespace {

struct CliOptions {
  std::string data_dir = "gambit-data";
  std::string passphrase;
  std::string command;
  std::vector<std::string> args;
  std::vector<std::string> players;
  int player_index = 0;
  bool multi_device = false;
};

void print_usage() {
  std::cout << gambit::kAppDisplayName << " " << gambit::kAppVersion << " (" << gambit::kBuildRelease << ")\n\n"
            << "usage: gambit_cli [--data DIR] [--passphrase P] <command> [args]\n\n"
            << "  create <course> <tee> <9|18> [pars] [--players pk,pk] [--multi]\n"
            << "  score <round> <hole> <strokes> [--player N]\n"
            << "  show <round>\n"
            << "  list\n"
            << "  finish <round>\n"
            << "  invite <round>\n"
            << "  join <token>\n"
            << "  whoami\n\n"
            << "The passphrase may also come from GAMBIT_PASSPHRASE.\n";
}

std::optional<std::int64_t> parse_int(std::string_view text) {
  std::int64_t parsed = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<CliOptions> parse_options(int argc, char** argv) {
  CliOptions options;
  if (const char* env = std::getenv("GAMBIT_PASSPHRASE"); env != nullptr) {
    options.passphrase = env;
  }
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--data" && has_value) {
      options.data_dir = argv[++i];
    } else if (arg == "--passphrase" && has_value) {
      options.passphrase = argv[++i];
    } else if (arg == "--players" && has_value) {
      options.players = gambit::util::split(argv[++i], ',');
    } else if (arg == "--player" && has_value) {
      const auto index = parse_int(argv[++i]);
      if (!index.has_value()) {
        return std::nullopt;
      }
      options.player_index = static_cast<int>(*index);
    } else if (arg == "--multi") {
      options.multi_device = true;
    } else if (arg.starts_with("--")) {
      return std::nullopt;
    } else if (options.command.empty()) {
      options.command = std::string{arg};
    } else {
      options.args.emplace_back(arg);
    }
  }
  if (options.command.empty()) {
    return std::nullopt;
  }
  return options;
}

// Par 4/3/5 repeating unless pars are given as a comma list.
std::optional<std::vector<gambit::HoleDefinition>> build_holes(int hole_count, std::string_view pars) {
  std::vector<gambit::HoleDefinition> holes;
  const std::vector<std::string> given = pars.empty() ? std::vector<std::string>{} : gambit::util::split(pars, ',');
  if (!given.empty() && static_cast<int>(given.size()) != hole_count) {
    return std::nullopt;
  }
  constexpr int kPattern[] = {4, 3, 5};
  for (int hole = 1; hole <= hole_count; ++hole) {
    int par = kPattern[(hole - 1) % 3];
    if (!given.empty()) {
      const auto parsed = parse_int(gambit::util::trim_copy(given[hole - 1]));
      if (!parsed.has_value()) {
        return std::nullopt;
      }
      par = static_cast<int>(*parsed);
    }
    holes.push_back({.hole_number = hole, .par = par});
  }
  return holes;
}

int report(const gambit::Result& result) {
  if (!result.ok) {
    std::cerr << "error (" << gambit::error_code_name(result.code) << "): " << result.message << '\n';
    return 1;
  }
  if (!result.message.empty()) {
    std::cout << result.message << '\n';
  }
  return 0;
}

std::optional<gambit::RoundId> round_arg(const CliOptions& options) {
  if (options.args.empty()) {
    return std::nullopt;
  }
  return parse_int(options.args[0]);
}

int show_round(gambit::CoreApi& api, gambit::RoundId round_id) {
  const auto course = api.course_for(round_id);
  if (!course.has_value()) {
    std::cerr << "error: unknown round " << round_id << '\n';
    return 1;
  }
  std::cout << course->course_name << " (" << course->tee_set << "), " << course->hole_count() << " holes\n";
  const auto remote = api.remote_scores(round_id);
  for (const auto& player : api.players(round_id)) {
    gambit::ScoreMap scores = api.current_scores(round_id, player.player_index);
    std::string source = "local";
    if (scores.empty() && player.player_index != gambit::kLocalPlayerIndex) {
      if (const auto it = remote.find(player.pubkey_hex); it != remote.end()) {
        scores = it->second;
        source = "synced";
      }
    }
    int total = 0;
    std::cout << "P" << player.player_index + 1 << " " << player.pubkey_hex.substr(0, 8) << "... [" << source
              << "]:";
    for (const auto& hole : course->holes) {
      const auto it = scores.find(hole.hole_number);
      std::cout << ' ' << (it == scores.end() ? std::string{"-"} : std::to_string(it->second));
      total += it == scores.end() ? 0 : it->second;
    }
    std::cout << "  total " << total << '\n';
  }
  std::cout << "finish enabled: " << (api.is_finish_enabled(round_id, gambit::kLocalPlayerIndex) ? "yes" : "no")
            << '\n';
  return 0;
}

int run(gambit::CoreApi& api, const CliOptions& options) {
  const std::string& command = options.command;

  if (command == "whoami") {
    const gambit::ServiceStatus status = api.status();
    std::cout << status.public_key << '\n'
              << "data: " << status.data_dir << '\n'
              << "relays: " << status.relays.size() << " (" << status.relays_dat_path << ")\n"
              << "rounds: " << status.round_count << ", courses: " << status.course_count << '\n';
    return 0;
  }

  if (command == "list") {
    for (const auto& item : api.list_rounds()) {
      std::cout << item.round_id << "  " << item.round_date << "  " << item.course_name << " (" << item.tee_set
                << ")  " << item.holes_scored << "/" << item.hole_count << " holes";
      if (item.total_strokes.has_value()) {
        std::cout << "  total " << *item.total_strokes;
      }
      std::cout << (item.completed ? "  completed" : "") << '\n';
    }
    return 0;
  }

  if (command == "create") {
    if (options.args.size() < 3) {
      print_usage();
      return 2;
    }
    const auto hole_count = parse_int(options.args[2]);
    const auto holes =
        hole_count.has_value() ? build_holes(static_cast<int>(*hole_count), options.args.size() > 3 ? options.args[3] : "")
                               : std::nullopt;
    if (!holes.has_value()) {
      std::cerr << "error: hole count must be 9 or 18 with one par per hole\n";
      return 2;
    }
    gambit::Round round;
    const gambit::Result created = api.create_round(
        {
            .course_name = options.args[0],
            .tee_set = options.args[1],
            .holes = *holes,
            .other_players = options.players,
            .round_date = {},
            .multi_device = options.multi_device,
        },
        round);
    if (created.ok) {
      std::cout << "round " << round.round_id << " on " << round.round_date << '\n';
    }
    return report(created);
  }

  if (command == "score") {
    const auto round_id = round_arg(options);
    const auto hole = options.args.size() > 1 ? parse_int(options.args[1]) : std::nullopt;
    const auto strokes = options.args.size() > 2 ? parse_int(options.args[2]) : std::nullopt;
    if (!round_id.has_value() || !hole.has_value() || !strokes.has_value()) {
      print_usage();
      return 2;
    }
    return report(api.record_score(*round_id, options.player_index, static_cast<int>(*hole),
                                   static_cast<int>(*strokes)));
  }

  if (command == "show") {
    const auto round_id = round_arg(options);
    if (!round_id.has_value()) {
      print_usage();
      return 2;
    }
    std::map<std::string, gambit::ScoreMap> synced;
    const gambit::Result refreshed = api.refresh_remote_scores(*round_id, synced);
    if (!refreshed.ok) {
      std::cerr << "sync unavailable: " << refreshed.message << '\n';
    }
    return show_round(api, *round_id);
  }

  if (command == "finish") {
    const auto round_id = round_arg(options);
    if (!round_id.has_value()) {
      print_usage();
      return 2;
    }
    const gambit::Result finished = api.finish_round(*round_id);
    api.drain();
    return report(finished);
  }

  if (command == "invite") {
    const auto round_id = round_arg(options);
    if (!round_id.has_value()) {
      print_usage();
      return 2;
    }
    std::string token;
    if (const gambit::Result prepared = api.invite_token(*round_id, token); !prepared.ok) {
      return report(prepared);
    }
    std::cout << gambit::to_nostr_uri(token) << '\n';
    std::vector<gambit::InviteDelivery> deliveries;
    const gambit::Result sent = api.send_invites(*round_id, deliveries);
    for (const auto& delivery : deliveries) {
      std::cout << "  " << delivery.recipient_pubkey.substr(0, 8) << "... "
                << (delivery.delivered ? "sent" : "failed: " + delivery.message) << '\n';
    }
    return report(sent);
  }

  if (command == "join") {
    if (options.args.empty()) {
      print_usage();
      return 2;
    }
    gambit::RoundId round_id = 0;
    const gambit::Result joined = api.join_round(options.args[0], round_id);
    if (joined.ok) {
      std::cout << "round " << round_id << '\n';
    }
    return report(joined);
  }

  print_usage();
  return 2;
}

}  // namespace

int main(int argc, char** argv) {
  const auto options = parse_options(argc, argv);
  if (!options.has_value()) {
    print_usage();
    return 2;
  }
  if (options->passphrase.empty()) {
    std::cerr << "error: a passphrase is required (--passphrase or GAMBIT_PASSPHRASE)\n";
    return 2;
  }

  gambit::CoreApi api;
  const gambit::Result init = api.init({
      .app_data_dir = options->data_dir,
      .passphrase = options->passphrase,
  });
  if (!init.ok) {
    std::cerr << "gambit init failed: " << init.message << '\n';
    return 1;
  }

  const int status = run(api, *options);
  api.drain();
  return status;
}
