#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>
#include <chrono>
#include <filesystem>
#include <thread>
#include <variant>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "indexer.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "swarm_node.hpp"
#include "tracker_client.hpp"
#include "utils.hpp"

constexpr std::chrono::milliseconds kProgressInterval{500};

ContentHash parse_hash_argument(const std::string& text, const char* what) {
  auto parsed = ContentHash::from_hex(trim_copy(text));
  if(!parsed) {
    throw QueryError(std::string(what) + " must be a 64-digit hex hash, got '" + text + "'");
  }
  return *parsed;
}

void print_contexts(Logger& out, const std::vector<ContextCandidate>& contexts, bool ambiguous) {
  for(const auto& context : contexts) {
    out.print("      in {} x{} {}{}",
              context.tree.is_zero() ? std::string("(root)") : context.tree.short_hex(),
              context.replica_count,
              context.display_name,
              ambiguous ? "  [ambiguous]" : "");
    ambiguous = false;
  }
}

void print_results(Logger& out, const std::vector<SearchResult>& results) {
  if(results.empty()) {
    out.print("No matches");
    return;
  }
  for(const auto& result : results) {
    if(const auto* file = std::get_if<FileMatch>(&result)) {
      out.print("file   {}  {:>10}  {} seeders  {}",
                file->hash.to_hex(), format_size(file->size), file->seeders, file->display_name);
      print_contexts(out, file->contexts, file->ambiguous);
      for(const auto& sibling : file->siblings) {
        out.print("        . {} {}", entry_kind_name(sibling.kind), sibling.name);
      }
      if(file->sibling_total > file->siblings.size()) {
        out.print("        . ... {} more", file->sibling_total - file->siblings.size());
      }
    } else {
      const auto& folder = std::get<FolderMatch>(result);
      out.print("folder {}  {:>10}  {} files  {} seeders  {}",
                folder.hash.to_hex(), format_size(folder.total_size), folder.file_count,
                folder.seeders, folder.display_name);
      print_contexts(out, folder.contexts, folder.ambiguous);
    }
  }
}

int follow_transfer(SwarmNode& node, const std::string& id, Logger& out) {
  for(;;) {
    auto progress = node.transfers().wait(id, kProgressInterval);
    if(!progress) {
      out.error("Transfer {} vanished", id);
      return 1;
    }
    out.print("{} {:<11} {:>10} / {:<10} {}/s  {} peers",
              id,
              transfer_state_name(progress->state),
              format_size(progress->bytes_done),
              format_size(progress->bytes_total),
              format_size(static_cast<uint64_t>(progress->rate)),
              progress->peers);
    if(progress->state == TransferState::Complete) {
      out.print("Saved to {}", progress->output.string());
      return 0;
    }
    if(progress->state == TransferState::Failed) {
      out.error("Failed ({}): {}", failure_cause_name(progress->cause), progress->message);
      return 1;
    }
    if(progress->state == TransferState::Cancelled) {
      return 1;
    }
  }
}

int run_command(SwarmNode& node, SettingsManager& settings, Logger& out) {
  const auto command = settings.get<std::string>("command");
  const auto target = settings.get<std::string>("target");

  if(node.role() == NodeRole::Tracker) {
    if(command != "serve") {
      out.error("A tracker only serves; '{}' needs --role peer", command);
      return 1;
    }
    node.wait_for_signal();
    return 0;
  }

  node.start_background();
  if(!settings.get<std::string>("share").empty()) {
    node.publish_share();
  }

  if(command == "serve") {
    node.wait_for_signal();
    return 0;
  }
  if(command == "search") {
    print_results(out, node.search(target));
    return 0;
  }
  if(command == "all") {
    for(const auto& root : node.all_declarations()) {
      out.print("{:<20} {}  {:>10}  {}", root.owner, root.root.to_hex(), format_size(root.size), root.root_name);
    }
    return 0;
  }
  if(command == "lookup") {
    auto entry = node.lookup(parse_hash_argument(target, "lookup target"));
    if(!entry) {
      out.print("Unknown hash");
      return 1;
    }
    out.print("{} {} {} held by {} owners", entry_kind_name(entry->kind), entry->hash.to_hex(),
              format_size(entry->size), entry->owner_count());
    for(const auto& ref : entry->refs) {
      out.print("  {} as '{}' in {}", ref.owner, ref.name,
                ref.container.is_zero() ? std::string("(root)") : ref.container.short_hex());
    }
    return 0;
  }
  if(command == "get") {
    TreeHash context;
    auto context_text = settings.get<std::string>("context");
    if(!context_text.empty()) context = parse_hash_argument(context_text, "context");
    auto id = node.download(parse_hash_argument(target, "get target"), context);
    return follow_transfer(node, id, out);
  }
  out.error("Unhandled command '{}'", command);
  return 1;
}

int main(int argc, char** argv){
  try {
    SwarmNode::Options options;
    options.workspace_root = std::filesystem::current_path();

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();
    settings->apply_environment();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? std::filesystem::path(argv[0]).filename().string() : "treeswarm");
    parser.parse(argc, argv, *settings);
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }
    if(settings->save_requested()) {
      if(!settings->save()) {
        print_err(nullptr, "Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    if(settings->get<std::string>("command") == "index") {
      init(settings->get<bool>("verbose"));
      Logger out("index");
      auto root = settings->get<std::string>("target").empty()
        ? settings->get<std::string>("share")
        : settings->get<std::string>("target");
      IndexOptions index_options;
      index_options.chunk_size = static_cast<uint32_t>(settings->get<uint64_t>("chunk_size"));
      auto result = Indexer(index_options).index(root);
      out.print("{} {} ({} files, {} folders, {})",
                result.declaration.root.to_hex(), result.declaration.root_name,
                result.file_count, result.directory_count, format_size(result.declaration.total_size()));
      for(const auto& issue : result.declaration.issues) {
        out.print("  skipped {}: {}", issue.path, issue.reason);
      }
      return 0;
    }

    SwarmNode node(settings, options);
    node.start();
    auto out = node.logger();
    int status = run_command(node, *settings, *out);
    node.stop();
    return status;
  } catch(const QueryError& e) {
    print_err(nullptr, "{}", e.what());
    return 2;
  } catch(const std::exception& e) {
    init(false);
    Logger logger("treeswarm-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
