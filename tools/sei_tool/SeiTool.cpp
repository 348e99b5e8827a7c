// Repository: MetaSEI
// Component: SEI Tool
// Purpose: Inject, extract and list metadata SEI messages in H.264 elementary stream files.
// Copyright (c) 2025 MetaSEI

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

#include "metasei/extraction/MetadataCollector.h"
#include "metasei/h264/AccessUnitSplitter.h"
#include "metasei/injection/MetadataInjector.h"
#include "metasei/sei/SeiMessageParser.h"
#include "metasei/sei/SeiUuid.h"

namespace
{
  constexpr char kDefaultUuid[] = "METADATA";

  struct ParsedArgs
  {
    std::string command;
    std::string input_path;
    std::string output_path;
    std::string sidecar_path;
    std::string uuid = kDefaultUuid;
    std::string metadata_json = "{}";
    int every_n = 0;
  };

  void PrintUsage()
  {
    std::cerr << "usage:\n"
              << "  metasei_tool inject --in <file.h264> --out <file.h264> [--uuid <uuid>]\n"
              << "                      [--meta '<json object>'] [--every-n N]\n"
              << "  metasei_tool extract --in <file.h264> [--uuid <uuid>] [--sidecar <file.json>]\n"
              << "  metasei_tool list --in <file.h264>" << std::endl;
  }

  bool ParseArgs(int argc, char **argv, ParsedArgs &args)
  {
    if (argc < 2)
    {
      return false;
    }
    args.command = argv[1];
    for (int i = 2; i < argc; ++i)
    {
      const std::string_view arg(argv[i]);
      if (arg == "--in" && i + 1 < argc)
      {
        args.input_path = argv[++i];
      }
      else if (arg == "--out" && i + 1 < argc)
      {
        args.output_path = argv[++i];
      }
      else if (arg == "--sidecar" && i + 1 < argc)
      {
        args.sidecar_path = argv[++i];
      }
      else if (arg == "--uuid" && i + 1 < argc)
      {
        args.uuid = argv[++i];
      }
      else if (arg == "--meta" && i + 1 < argc)
      {
        args.metadata_json = argv[++i];
      }
      else if (arg == "--every-n" && i + 1 < argc)
      {
        const char *text = argv[++i];
        char *end = nullptr;
        errno = 0;
        const long value = std::strtol(text, &end, 10);
        if (end == text || *end != '\0')
        {
          std::cerr << "[SeiTool] --every-n expects an integer" << std::endl;
          return false;
        }
        if (errno == ERANGE || value < 0 || value > std::numeric_limits<int>::max())
        {
          std::cerr << "[SeiTool] --every-n must be between 0 and "
                    << std::numeric_limits<int>::max() << ", got " << text << std::endl;
          return false;
        }
        args.every_n = static_cast<int>(value);
      }
      else
      {
        std::cerr << "[SeiTool] Unknown or incomplete argument: " << arg << std::endl;
        return false;
      }
    }
    return !args.input_path.empty();
  }

  bool ReadFile(const std::string &path, std::vector<uint8_t> &data)
  {
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
      std::cerr << "[SeiTool] Cannot open " << path << std::endl;
      return false;
    }
    data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
  }

  bool ParseMetadata(const std::string &text, Json::Value &metadata)
  {
    Json::CharReaderBuilder builder;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &metadata, &errors))
    {
      std::cerr << "[SeiTool] --meta is not valid JSON: " << errors << std::endl;
      return false;
    }
    return true;
  }

  int RunInject(const ParsedArgs &args)
  {
    if (args.output_path.empty())
    {
      std::cerr << "[SeiTool] inject requires --out" << std::endl;
      return EXIT_FAILURE;
    }
    Json::Value metadata;
    if (!ParseMetadata(args.metadata_json, metadata))
    {
      return EXIT_FAILURE;
    }

    metasei::injection::InjectorConfig config;
    config.uuid = args.uuid;
    config.inject_every_n_frames = args.every_n;
    config.framing = metasei::h264::NalFraming::kAnnexB;
    auto injector = metasei::injection::MetadataInjector::Create(config, metadata);
    if (!injector)
    {
      return EXIT_FAILURE;
    }

    std::vector<uint8_t> stream;
    if (!ReadFile(args.input_path, stream))
    {
      return EXIT_FAILURE;
    }

    std::ofstream out(args.output_path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
      std::cerr << "[SeiTool] Cannot open " << args.output_path << " for writing" << std::endl;
      return EXIT_FAILURE;
    }

    for (const auto &au : metasei::h264::SplitAccessUnits(stream.data(), stream.size()))
    {
      const uint8_t *au_data = stream.data() + au.offset;
      const auto rewritten = injector->Inject(au_data, au.size, au.is_keyframe);
      if (rewritten)
      {
        out.write(reinterpret_cast<const char *>(rewritten->data()),
                  static_cast<std::streamsize>(rewritten->size()));
      }
      else
      {
        out.write(reinterpret_cast<const char *>(au_data), static_cast<std::streamsize>(au.size));
      }
    }
    if (!out)
    {
      std::cerr << "[SeiTool] Write to " << args.output_path << " failed" << std::endl;
      return EXIT_FAILURE;
    }

    const auto stats = injector->Snapshot();
    std::cout << "[SeiTool] Access units: " << stats.frames_seen
              << " | injected: " << stats.frames_injected
              << " | sei_bytes: " << stats.bytes_injected << std::endl;
    return EXIT_SUCCESS;
  }

  int RunExtract(const ParsedArgs &args)
  {
    metasei::extraction::CollectorConfig config;
    config.uuid = args.uuid;
    config.framing = metasei::h264::NalFraming::kAnnexB;
    auto collector = metasei::extraction::MetadataCollector::Create(config);
    if (!collector)
    {
      return EXIT_FAILURE;
    }

    std::vector<uint8_t> stream;
    if (!ReadFile(args.input_path, stream))
    {
      return EXIT_FAILURE;
    }

    for (const auto &au : metasei::h264::SplitAccessUnits(stream.data(), stream.size()))
    {
      collector->Consume(stream.data() + au.offset, au.size);
    }

    const auto stats = collector->Snapshot();
    std::cout << "[SeiTool] Access units: " << stats.buffers_processed
              << " | records: " << stats.records_extracted
              << " | unique: " << stats.unique_records << std::endl;

    if (!args.sidecar_path.empty() && !collector->WriteJsonFile(args.sidecar_path))
    {
      return EXIT_FAILURE;
    }
    return stats.unique_records > 0 ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  int RunList(const ParsedArgs &args)
  {
    std::vector<uint8_t> stream;
    if (!ReadFile(args.input_path, stream))
    {
      return EXIT_FAILURE;
    }
    const auto messages = metasei::sei::ExtractUserData(stream.data(), stream.size(),
                                                        metasei::h264::NalFraming::kAnnexB);
    for (const auto &message : messages)
    {
      std::cout << "uuid=" << metasei::sei::FormatSeiUuid(message.uuid)
                << " body_bytes=" << message.body.size() << std::endl;
    }
    std::cout << "[SeiTool] user_data_unregistered messages: " << messages.size() << std::endl;
    return EXIT_SUCCESS;
  }

} // namespace

int main(int argc, char **argv)
{
  ParsedArgs args;
  if (!ParseArgs(argc, argv, args))
  {
    PrintUsage();
    return EXIT_FAILURE;
  }

  if (args.command == "inject")
  {
    return RunInject(args);
  }
  if (args.command == "extract")
  {
    return RunExtract(args);
  }
  if (args.command == "list")
  {
    return RunList(args);
  }

  std::cerr << "[SeiTool] Unknown command: " << args.command << std::endl;
  PrintUsage();
  return EXIT_FAILURE;
}
