#pragma once

// Command-line parsing for lra1_tool

#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../protocol/transfer_mode.hpp"

#include <getopt.h>
#include <cstdio>

namespace lraBsl {
    namespace utils {

        struct tool_options {
            const char* port{nullptr};
            const char* file{nullptr};
            bool dtr_reset{false};
            bool sw_reset{false};
            bool debug{false};
            protocol::transfer_mode mode{protocol::transfer_mode::update};
        };

        enum class parse_outcome : u8 {
            run = 0,
            help,
            usage_error
        };

        inline void show_usage(const char* prog) noexcept {
            std::printf("usage: %s [options]\n", prog);
            std::printf("LRA1 Tool\nVersion: %s\n\n", LRABSL_VERSION);
            std::printf("  -p, --port <dev>   serial port (e.g. /dev/ttyUSB0), required\n");
            std::printf("  -r, --reset        use DTR to reset before transfer\n");
            std::printf("  -s, --swreset      software reset before transfer\n");
            std::printf("  -b, --baud <rate>  accepted for compatibility; the link always runs at %u\n",
                        static_cast<unsigned>(LRABSL_BAUD_RATE));
            std::printf("  -u, --update       update LRA1 firmware (default mode)\n");
            std::printf("  -v, --verify       verify LRA1 firmware\n");
            std::printf("  -i, --init         initialize the settings (no file needed)\n");
            std::printf("  -f, --file <file>  firmware file (required for update/verify)\n");
            std::printf("  -d, --debug        print sent/received bytes\n");
            std::printf("  -h, --help         show this help\n");
        }

        /**
         * @brief Parse argv into opts
         *
         * -u, -v and -i may repeat but must not name different modes.
         * Diagnostics go to stderr; help goes to stdout.
         */
        inline parse_outcome parse_options(int argc, char** argv, tool_options& opts) noexcept {
            static const option longopts[] = {
                {"port",    required_argument, nullptr, 'p'},
                {"reset",   no_argument,       nullptr, 'r'},
                {"swreset", no_argument,       nullptr, 's'},
                {"baud",    required_argument, nullptr, 'b'},
                {"update",  no_argument,       nullptr, 'u'},
                {"verify",  no_argument,       nullptr, 'v'},
                {"init",    no_argument,       nullptr, 'i'},
                {"file",    required_argument, nullptr, 'f'},
                {"debug",   no_argument,       nullptr, 'd'},
                {"help",    no_argument,       nullptr, 'h'},
                {nullptr,   0,                 nullptr, 0},
            };

            if (argc <= 1) {
                std::fprintf(stderr, "%s: Use --help option to see usage\n", argc > 0 ? argv[0] : "lra1_tool");
                return parse_outcome::usage_error;
            }

            optional<protocol::transfer_mode> selected;
            bool conflicting = false;
            auto select_mode = [&selected, &conflicting](protocol::transfer_mode mode) {
                if (selected.has_value() && selected.value() != mode) { conflicting = true; }
                selected = mode;
            };

            optind = 0; // glibc: restart scanning from argv[1]
            int c = 0;
            while ((c = getopt_long(argc, argv, "p:rsb:uvif:dh", longopts, nullptr)) != -1) {
                switch (c) {
                    case 'p': opts.port = optarg; break;
                    case 'r': opts.dtr_reset = true; break;
                    case 's': opts.sw_reset = true; break;
                    case 'b': break; // fixed link rate
                    case 'u': select_mode(protocol::transfer_mode::update); break;
                    case 'v': select_mode(protocol::transfer_mode::verify); break;
                    case 'i': select_mode(protocol::transfer_mode::init); break;
                    case 'f': opts.file = optarg; break;
                    case 'd': opts.debug = true; break;
                    case 'h': show_usage(argv[0]); return parse_outcome::help;
                    default:  return parse_outcome::usage_error;
                }
            }

            if (conflicting) {
                std::fprintf(stderr, "%s: -u, -v and -i are mutually exclusive\n", argv[0]);
                return parse_outcome::usage_error;
            }
            if (selected.has_value()) { opts.mode = selected.value(); }
            if (opts.port == nullptr) {
                std::fprintf(stderr, "%s: the following arguments are required: -p/--port\n", argv[0]);
                return parse_outcome::usage_error;
            }
            if (opts.mode != protocol::transfer_mode::init && opts.file == nullptr) {
                std::fprintf(stderr,
                             "%s: No update file specified. Use -f or --file to specify the firmware file.\n",
                             argv[0]);
                return parse_outcome::usage_error;
            }
            return parse_outcome::run;
        }

    } // namespace utils
} // namespace lraBsl
