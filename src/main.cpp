#include "swiftdrop/chunk.hpp"
#include "swiftdrop/cli_colors.hpp"
#include "swiftdrop/constants.hpp"
#include "swiftdrop/errors.hpp"
#include "swiftdrop/file_source.hpp"
#include "swiftdrop/keys.hpp"
#include "swiftdrop/log.hpp"
#include "swiftdrop/loopback.hpp"
#include "swiftdrop/orchestrator.hpp"
#include "swiftdrop/rendezvous.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace cli = swiftdrop::cli;

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  swiftdrop version\n";
    std::cout << "  swiftdrop keygen [--bits <n>]\n";
    std::cout << "  swiftdrop chunk-size <bytes>\n";
    std::cout << "  swiftdrop code-info <code>\n";
    std::cout << "  swiftdrop loopback <file> [--out <path>] [--chunk-size <n>] [--unordered] [--no-encrypt]"
                 " [--compress <1-9>] [--parallel <n>] [--max-message <n>]\n";
    std::cout << "Global flags: --no-color, --log-level <trace|debug|info|warn|error|off>\n";
}

std::string HumanBytes(std::uint64_t bytes) {
    static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << " " << kUnits[unit];
    return out.str();
}

std::uint64_t ParseCount(const std::string& raw, const char* what) {
    if (raw.empty() || raw.find_first_not_of("0123456789") != std::string::npos) {
        throw swiftdrop::ValidationError(std::string("Invalid ") + what + ": " + raw);
    }
    try {
        return std::stoull(raw);
    } catch (const std::exception&) {
        throw swiftdrop::ValidationError(std::string("Invalid ") + what + ": " + raw);
    }
}

struct LoopbackArgs {
    std::string input;
    std::string output;
    std::size_t chunk_size = 0;
    bool unordered = false;
    bool encrypt = true;
    int compression_level = 0;
    std::size_t parallelism = swiftdrop::constants::kDefaultParallelism;
    std::size_t max_message = 256u * 1024u * 1024u;
};

// Strips the global flags and applies them.
std::vector<std::string> TakeGlobalFlags(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--no-color") {
            cli::SetColorsEnabled(false);
        } else if (arg == "--log-level") {
            if (i + 1 >= argc) {
                throw swiftdrop::ValidationError("Missing log level");
            }
            swiftdrop::log::SetLevel(argv[++i]);
        } else {
            args.push_back(std::move(arg));
        }
    }
    return args;
}

LoopbackArgs ParseLoopbackArgs(const std::vector<std::string>& args) {
    LoopbackArgs opts;
    if (args.size() < 2) {
        throw swiftdrop::ValidationError("Missing input path");
    }
    opts.input = args[1];
    std::size_t idx = 2;
    auto value = [&](const char* flag) -> const std::string& {
        if (idx + 1 >= args.size()) {
            throw swiftdrop::ValidationError(std::string("Missing value for ") + flag);
        }
        idx += 2;
        return args[idx - 1];
    };
    while (idx < args.size()) {
        const std::string& flag = args[idx];
        if (flag == "--out" || flag == "-o") {
            opts.output = value("--out");
        } else if (flag == "--chunk-size") {
            opts.chunk_size = static_cast<std::size_t>(ParseCount(value("--chunk-size"), "chunk size"));
        } else if (flag == "--unordered") {
            opts.unordered = true;
            idx += 1;
        } else if (flag == "--no-encrypt") {
            opts.encrypt = false;
            idx += 1;
        } else if (flag == "--compress") {
            opts.compression_level = static_cast<int>(ParseCount(value("--compress"), "compression level"));
        } else if (flag == "--parallel") {
            opts.parallelism = static_cast<std::size_t>(ParseCount(value("--parallel"), "parallelism"));
        } else if (flag == "--max-message") {
            opts.max_message = static_cast<std::size_t>(ParseCount(value("--max-message"), "message size"));
        } else {
            throw swiftdrop::ValidationError("Unknown flag: " + flag);
        }
    }
    if (opts.output.empty()) {
        opts.output = opts.input + ".received";
    }
    return opts;
}

int RunKeygen(const std::vector<std::string>& args) {
    int bits = swiftdrop::constants::RsaModulusBits();
    if (args.size() >= 3 && args[1] == "--bits") {
        bits = static_cast<int>(ParseCount(args[2], "modulus length"));
    } else if (args.size() != 1) {
        PrintUsage();
        return 2;
    }
    swiftdrop::keys::KeyPair pair = swiftdrop::keys::GenerateAsymmetricKeyPair(bits);
    std::cout << cli::Dim("rsa-oaep-sha256 " + std::to_string(bits) + " bits") << "\n";
    std::cout << swiftdrop::keys::ExportPublicKey(pair.public_key.get()) << "\n";
    return 0;
}

int RunChunkSize(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        PrintUsage();
        return 2;
    }
    std::uint64_t size = ParseCount(args[1], "size");
    std::size_t chunk = swiftdrop::chunk::OptimalChunkSize(size);
    std::cout << "file_size: " << HumanBytes(size) << "\n";
    std::cout << "chunk_size: " << HumanBytes(chunk) << " (" << chunk << " bytes)\n";
    std::cout << "chunk_count: " << swiftdrop::chunk::ChunkCount(size, chunk) << "\n";
    std::cout << "high_performance: " << (swiftdrop::chunk::ShouldUseHighPerformanceMode(size) ? "yes" : "no")
              << "\n";
    return 0;
}

int RunCodeInfo(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        PrintUsage();
        return 2;
    }
    swiftdrop::rendezvous::RendezvousCode code = swiftdrop::rendezvous::Parse(args[1]);
    std::cout << "negotiation: " << code.negotiation_blob.size() << " chars\n";
    std::cout << "ice_server: " << (code.ice_server.empty() ? "<none>" : code.ice_server) << "\n";
    std::cout << "chunk_size: " << HumanBytes(code.chunk_size) << "\n";
    std::cout << "high_performance: " << (code.high_performance ? "yes" : "no") << "\n";
    std::cout << "public_key: " << (code.public_key.empty() ? "<none>" : "present") << "\n";
    return 0;
}

int RunLoopback(const std::vector<std::string>& args) {
    LoopbackArgs opts = ParseLoopbackArgs(args);
    swiftdrop::file_source::FilePayload file = swiftdrop::file_source::ReadFile(opts.input);

    swiftdrop::loopback::LoopbackOptions link;
    link.ordered = !opts.unordered;
    link.max_message_size = opts.max_message;
    auto negotiator = std::make_shared<swiftdrop::loopback::LoopbackNegotiator>(link);
    auto store = std::make_shared<swiftdrop::loopback::MemoryRendezvousStore>();
    swiftdrop::TransferContext context(store);
    swiftdrop::Orchestrator sender(context, negotiator);
    swiftdrop::Orchestrator receiver(context, negotiator);

    swiftdrop::ReceiveOptions receive;
    receive.ApplyEnvironment();
    receive.on_progress = [](int percent) { cli::DrawProgress("receiving", percent); };
    std::string output = opts.output;
    receive.on_complete = [output](const swiftdrop::protocol::FileMetadata&, std::vector<std::uint8_t> data) {
        swiftdrop::file_source::WriteFile(output, data);
    };

    swiftdrop::SendOptions send;
    send.ApplyEnvironment();
    if (opts.chunk_size != 0) {
        send.chunk_size = opts.chunk_size;
    }
    send.encrypt = send.encrypt && opts.encrypt;
    if (opts.compression_level != 0) {
        send.compression_level = opts.compression_level;
    }
    send.parallelism = opts.parallelism;

    auto started = std::chrono::steady_clock::now();
    swiftdrop::ReceiveTicket ticket = receiver.CreateReceiveCode(receive);
    swiftdrop::TransferSessionPtr outbound = sender.InitiateSend(file, ticket.code, send);
    swiftdrop::TransferSessionPtr inbound = receiver.AcceptIncoming(outbound->local_code(), receive);
    outbound->Wait();
    inbound->Wait();
    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    swiftdrop::SessionSnapshot out = outbound->Snapshot();
    swiftdrop::SessionSnapshot in = inbound->Snapshot();
    std::cout << "sender: " << swiftdrop::StatusName(out.status) << ", " << HumanBytes(out.bytes_transferred)
              << " in chunks of " << HumanBytes(out.chunk_size) << ", max attempts " << out.max_attempts_used << "\n";
    std::cout << "receiver: " << swiftdrop::StatusName(in.status) << ", " << HumanBytes(in.bytes_transferred) << "\n";
    if (out.status != swiftdrop::TransferStatus::Success || in.status != swiftdrop::TransferStatus::Success) {
        const swiftdrop::SessionSnapshot& failed = out.status != swiftdrop::TransferStatus::Success ? out : in;
        std::cerr << cli::BoldRed("Transfer failed") << " (" << swiftdrop::ErrorKindName(failed.error_kind)
                  << "): " << failed.error_message << "\n";
        return 1;
    }
    double rate = seconds > 0 ? static_cast<double>(in.bytes_transferred) / seconds : 0.0;
    std::cout << cli::BoldGreen("Transferred") << " " << file.metadata.name << " -> " << opts.output << " ("
              << HumanBytes(in.bytes_transferred) << " at " << HumanBytes(static_cast<std::uint64_t>(rate))
              << "/s)\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args = TakeGlobalFlags(argc, argv);
        if (args.empty()) {
            PrintUsage();
            return 2;
        }
        const std::string& command = args[0];
        if (command == "version") {
            std::cout << "swiftdrop " << swiftdrop::constants::kEngineVersion << "\n";
            return 0;
        }
        if (command == "keygen") {
            return RunKeygen(args);
        }
        if (command == "chunk-size") {
            return RunChunkSize(args);
        }
        if (command == "code-info") {
            return RunCodeInfo(args);
        }
        if (command == "loopback") {
            return RunLoopback(args);
        }
        PrintUsage();
        return 2;
    } catch (const swiftdrop::Error& exc) {
        std::cerr << cli::BoldRed("Error") << " (" << swiftdrop::ErrorKindName(exc.kind()) << "): " << exc.what()
                  << "\n";
        return 1;
    } catch (const std::exception& exc) {
        std::cerr << cli::BoldRed("Error") << ": " << exc.what() << "\n";
        return 1;
    }
}
