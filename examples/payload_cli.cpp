// payload_cli: query and edit a JSON document from the command line
//
// Reads a document from a file (or stdin when the file is "-"), applies
// each command in order and prints the resulting document as canonical
// text. `get` commands print their result instead of changing anything.
//
// Usage:
//   payload_cli <file|-> [get <path>] [set <path> <json>] [del <path>] ...
//
// Example:
//   echo '{"arr":[{"id":1},{"id":2}]}' | payload_cli - set '$.arr[*].tag' '"t"' get '$..tag'

#include <fieldpath-cpp/fieldpath.hpp>

#include <glog/logging.h>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fp = fieldpath_cpp;

namespace {

auto read_input(std::string_view source) -> std::string {
    if (source == "-") {
        return std::string{std::istreambuf_iterator<char>{std::cin},
                           std::istreambuf_iterator<char>{}};
    }
    auto file = std::ifstream{std::string{source}, std::ios::binary};
    if (!file) {
        throw std::runtime_error{"cannot open " + std::string{source}};
    }
    auto buffer = std::ostringstream{};
    buffer << file.rdbuf();
    return buffer.str();
}

void usage(const char* program) {
    std::fprintf(stderr,
                 "usage: %s <file|-> [get <path>] [set <path> <json>] [del <path>] ...\n",
                 program);
}

}  // anonymous namespace

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    if (argc < 2) {
        usage(argv[0]);
        return 2;
    }

    auto rec = fp::Record{};
    try {
        rec.set_field("json_payload", read_input(argv[1]));

        for (int i = 2; i < argc;) {
            auto command = std::string_view{argv[i]};
            if (command == "get" && i + 1 < argc) {
                auto result = rec.resolve_path(argv[i + 1]);
                std::printf("%s\n", fp::encode(result).c_str());
                i += 2;
            } else if (command == "set" && i + 2 < argc) {
                rec.update_path(argv[i + 1], fp::parse_literal(argv[i + 2]));
                i += 3;
            } else if (command == "del" && i + 1 < argc) {
                rec.delete_path(argv[i + 1]);
                i += 2;
            } else {
                usage(argv[0]);
                return 2;
            }
        }

        std::printf("%s\n", fp::encode(rec.resolve_path("$")).c_str());
    } catch (const fp::Exception& e) {
        std::fprintf(stderr, "error (%s): %s\n",
                     std::string{fp::to_string_view(e.kind())}.c_str(), e.what());
        return 1;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }
    return 0;
}
