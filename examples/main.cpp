#include "sgnet/eventloop/EventLoop.hpp"
#include "sgnet/io/FileStream.hpp"
#include "sgnet/log/Logger.hpp"
#include "sgnet/net/SocketError.hpp"
#include "sgnet/net/SocketOptions.hpp"
#include "sgnet/net/TCPSocket.hpp"
#include "sgnet/send/SendDescriptor.hpp"
#include "sgnet/send/SendOperation.hpp"

#include <cstdint>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

constexpr std::string_view kUsage =
    "usage: sgnet-send [--disconnect] [--reuse] [--send-size N] [--connect-timeout MS] [--verbose]\n"
    "                  HOST PORT DESCRIPTOR...\n"
    "descriptors:\n"
    "  text:STRING                  bytes of STRING\n"
    "  file:PATH[:OFFSET:LENGTH]    region of a file opened for the send\n"
    "  stream:PATH[:OFFSET:LENGTH]  region of a stream opened by this tool\n"
    "  empty                        null element\n";

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

uint64_t parseUnsigned(const std::string& text, const char* what) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw UsageError(std::string("invalid ") + what + ": '" + text + "'");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw UsageError(std::string(what) + " out of range: '" + text + "'");
    }
}

struct Region {
    std::string path;
    uint64_t offset = 0;
    uint64_t length = 0;
};

// PATH or PATH:OFFSET:LENGTH. Paths may contain ':' as long as the last two
// fields are numeric.
Region parseRegion(const std::string& text) {
    Region region{text, 0, 0};
    const size_t last = text.rfind(':');
    if (last == std::string::npos || last == 0) {
        return region;
    }
    const size_t middle = text.rfind(':', last - 1);
    if (middle == std::string::npos) {
        return region;
    }

    const std::string offset_text = text.substr(middle + 1, last - middle - 1);
    const std::string length_text = text.substr(last + 1);
    if (offset_text.empty() || length_text.empty() ||
        offset_text.find_first_not_of("0123456789") != std::string::npos ||
        length_text.find_first_not_of("0123456789") != std::string::npos) {
        return region;
    }

    region.path = text.substr(0, middle);
    region.offset = parseUnsigned(offset_text, "offset");
    region.length = parseUnsigned(length_text, "length");
    return region;
}

struct Options {
    sgnet::send::SendPacketsFlags flags = sgnet::send::SendPacketsFlags::None;
    size_t send_size = 0;
    sgnet::net::SocketOptions socket;
    bool verbose = false;
    std::string host;
    std::string port;
    std::vector<std::string> descriptors;
};

Options parseArguments(int argc, char** argv) {
    Options options;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        const auto nextValue = [&](const char* name) -> std::string {
            if (i + 1 >= argc) {
                throw UsageError(std::string(name) + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--disconnect") {
            options.flags = options.flags | sgnet::send::SendPacketsFlags::Disconnect;
        } else if (arg == "--reuse") {
            options.flags = options.flags | sgnet::send::SendPacketsFlags::ReuseSocket;
        } else if (arg == "--send-size") {
            options.send_size = static_cast<size_t>(parseUnsigned(nextValue("--send-size"), "send size"));
        } else if (arg == "--connect-timeout") {
            options.socket.connect_timeout_ms =
                static_cast<uint32_t>(parseUnsigned(nextValue("--connect-timeout"), "connect timeout"));
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            throw UsageError("");
        } else if (arg.size() > 2 && arg.substr(0, 2) == "--") {
            throw UsageError("unknown option " + std::string(arg));
        } else {
            positional.emplace_back(arg);
        }
    }

    if (positional.size() < 3) {
        throw UsageError("HOST, PORT and at least one DESCRIPTOR are required");
    }
    options.host = positional[0];
    options.port = positional[1];
    options.descriptors.assign(positional.begin() + 2, positional.end());
    return options;
}

// Builds the descriptor list. Streams named on the command line are opened
// here and kept alive in `streams` for the duration of the send.
std::vector<sgnet::send::SendDescriptor> buildDescriptors(
    const std::vector<std::string>& args,
    std::vector<std::unique_ptr<sgnet::io::FileStream>>& streams) {
    std::vector<sgnet::send::SendDescriptor> descriptors;
    descriptors.reserve(args.size());

    for (const std::string& arg : args) {
        if (arg == "empty") {
            descriptors.emplace_back(sgnet::send::EmptyRegion{});
        } else if (arg.rfind("text:", 0) == 0) {
            // Points into `args`, which outlives the send.
            descriptors.emplace_back(sgnet::send::memoryRegion(arg.data() + 5, arg.size() - 5));
        } else if (arg.rfind("file:", 0) == 0) {
            const Region region = parseRegion(arg.substr(5));
            descriptors.emplace_back(sgnet::send::FileRegion(region.path, region.offset, region.length));
        } else if (arg.rfind("stream:", 0) == 0) {
            const Region region = parseRegion(arg.substr(7));
            streams.push_back(std::make_unique<sgnet::io::FileStream>(sgnet::io::FileStream::open(region.path)));
            descriptors.emplace_back(sgnet::send::StreamRegion(streams.back().get(), region.offset, region.length));
        } else {
            throw UsageError("unrecognized descriptor '" + arg + "'");
        }
    }
    return descriptors;
}

}  // namespace

int main(int argc, char** argv) {
    Options options;
    try {
        options = parseArguments(argc, argv);
    } catch (const UsageError& ex) {
        if (ex.what()[0] != '\0') {
            std::cerr << "sgnet-send: " << ex.what() << '\n';
        }
        std::cerr << kUsage;
        return 2;
    }

    if (options.verbose) {
        sgnet::log::setLevel(sgnet::log::Level::Debug);
    }

    sgnet::EventLoop event_loop;
    std::exception_ptr loop_error;
    std::thread loop_thread([&] {
        try {
            event_loop.run();
        } catch (const std::exception&) {
            loop_error = std::current_exception();
        }
    });

    int exit_code = 1;
    try {
        std::vector<std::unique_ptr<sgnet::io::FileStream>> streams;
        sgnet::send::SendOperationRequest request;
        request.descriptors = buildDescriptors(options.descriptors, streams);
        request.flags = options.flags;
        request.send_size = options.send_size;

        sgnet::net::TCPSocket socket(event_loop, options.socket);
        socket.connect(sgnet::net::Endpoint::resolve(options.host, options.port));

        const sgnet::send::ScatterGatherSendOperation operation{};
        const sgnet::send::SendOperationResult result = operation.execute(socket, &request).get();

        std::cout << "status: " << sgnet::net::toString(result.status)
                  << ", bytes: " << result.bytes_transferred << '\n';
        exit_code = (result.status == sgnet::net::SocketError::Success) ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "sgnet-send failed: " << ex.what() << '\n';
        exit_code = 1;
    }

    event_loop.post([&event_loop] { event_loop.stop(); });
    loop_thread.join();
    if (loop_error) {
        try {
            std::rethrow_exception(loop_error);
        } catch (const std::exception& ex) {
            std::cerr << "event loop failed: " << ex.what() << '\n';
            exit_code = 1;
        }
    }
    return exit_code;
}
