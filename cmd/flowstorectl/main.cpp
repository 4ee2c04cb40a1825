#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "cmd/flowstorectl/args.hpp"
#include "flowstore/store/v1.hpp"

using namespace flowstore::store::v1;
using flowstore::ctl::ParseOrder;
using flowstore::ctl::ParseU64;

static void Usage() {
  std::cout << "Usage:\n"
            << "  flowstorectl <addr> insert <mid> <kind> <payload_file|->\n"
            << "  flowstorectl <addr> replace <mid> <kind> <payload_file|->\n"
            << "  flowstorectl <addr> update <id> <payload_file|->\n"
            << "  flowstorectl <addr> get <id>\n"
            << "  flowstorectl <addr> list-mid <mid>\n"
            << "  flowstorectl <addr> list-kind <kind> [limit] [offset]\n"
            << "  flowstorectl <addr> delete <id>\n"
            << "  flowstorectl <addr> delete-mid <mid>\n"
            << "  flowstorectl <addr> flows [filter] [--order=insertion|created|method|host|size|status|duration] [--desc]\n"
            << "                             [--limit=N] [--offset=N]\n"
            << "  flowstorectl <addr> headers [pattern] [--regex] [--request|--response] [--mid=M]\n";
}

static std::optional<std::string> ReadPayload(const std::string& source) {
  if (source == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream in(source, std::ios::binary);
  if (!in) {
    std::cerr << "cannot read " << source << "\n";
    return std::nullopt;
  }
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

static void PrintChunk(const Chunk& c) {
  std::cout << "id=" << c.id() << " mid=" << c.mid() << " kind=" << c.kind() << " seq=" << c.seq() << " method=" << c.method()
            << " bytes=" << c.payload().size() << "\n";
}

static void PrintFlow(const FlowRow& f) {
  auto opt = [](bool has, const auto& value) {
    std::ostringstream out;
    if (has) {
      out << value;
    } else {
      out << "-";
    }
    return out.str();
  };

  std::cout << f.chunk_id() << '\t' << f.mid() << '\t' << opt(f.has_method(), f.method()) << '\t' << opt(f.has_host(), f.host())
            << opt(f.has_path(), f.path()) << '\t' << opt(f.has_status_code(), f.status_code()) << '\t'
            << opt(f.has_content_type(), f.content_type()) << '\t' << opt(f.has_duration(), f.duration()) << '\t'
            << opt(f.has_size(), f.size()) << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string              addr = argv[1];
  std::string              cmd  = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto chunk_stub = ChunkStoreService::NewStub(channel);
  auto query_stub = FlowQueryService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "insert" || cmd == "replace") {
    if (args.size() < 3) return 1;

    auto payload = ReadPayload(args[2]);
    if (!payload) return 1;

    NewChunk chunk;
    chunk.set_mid(args[0]);
    chunk.set_kind(args[1]);
    chunk.set_payload(*payload);

    if (cmd == "insert") {
      InsertChunksRequest req;
      *req.add_chunks() = chunk;

      InsertChunksResponse resp;
      auto                 status = chunk_stub->InsertChunks(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& c : resp.chunks()) PrintChunk(c);
      return 0;
    }

    ReplaceChunkRequest req;
    *req.mutable_chunk() = chunk;

    ReplaceChunkResponse resp;
    auto                 status = chunk_stub->ReplaceChunk(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintChunk(resp.chunk());
    if (resp.has_replaced_id()) std::cout << "replaced=" << resp.replaced_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "update") {
    if (args.size() < 2) return 1;

    auto id      = ParseU64(args[0]);
    auto payload = ReadPayload(args[1]);
    if (!id || !payload) return 1;

    UpdatePayloadRequest req;
    req.set_id(*id);
    req.set_payload(*payload);

    UpdatePayloadResponse resp;
    auto                  status = chunk_stub->UpdatePayload(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintChunk(resp.chunk());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (args.empty()) return 1;

    auto id = ParseU64(args[0]);
    if (!id) return 1;

    GetChunkRequest req;
    req.set_id(*id);

    GetChunkResponse resp;
    auto             status = chunk_stub->GetChunk(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintChunk(resp.chunk());
    std::cout << resp.chunk().payload() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list-mid" || cmd == "list-kind") {
    if (args.empty()) return 1;

    ListChunksRequest req;
    if (cmd == "list-mid") {
      req.set_mid(args[0]);
    } else {
      req.set_kind(args[0]);
      if (args.size() >= 2) {
        auto limit = ParseU64(args[1]);
        if (!limit) return 1;
        req.set_limit(*limit);
      }
      if (args.size() >= 3) {
        auto offset = ParseU64(args[2]);
        if (!offset) return 1;
        req.set_offset(*offset);
      }
    }

    ListChunksResponse resp;
    auto               status = chunk_stub->ListChunks(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& c : resp.chunks()) PrintChunk(c);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (args.empty()) return 1;

    auto id = ParseU64(args[0]);
    if (!id) return 1;

    DeleteChunkRequest req;
    req.set_id(*id);

    DeleteChunkResponse resp;
    auto                status = chunk_stub->DeleteChunk(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete-mid") {
    if (args.empty()) return 1;

    DeleteMessageRequest req;
    req.set_mid(args[0]);

    DeleteMessageResponse resp;
    auto                  status = chunk_stub->DeleteMessage(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted=" << resp.deleted() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "flows") {
    ListFlowsRequest req;
    for (const auto& arg : args) {
      if (StartsWith(arg, "--order=")) {
        auto order = ParseOrder(arg.substr(8));
        if (!order) {
          std::cerr << "unsupported order: " << arg.substr(8) << "\n";
          return 1;
        }
        req.set_order(*order);
      } else if (arg == "--desc") {
        req.set_descending(true);
      } else if (StartsWith(arg, "--limit=")) {
        auto limit = ParseU64(arg.substr(8));
        if (!limit) return 1;
        req.set_limit(*limit);
      } else if (StartsWith(arg, "--offset=")) {
        auto offset = ParseU64(arg.substr(9));
        if (!offset) return 1;
        req.set_offset(*offset);
      } else {
        req.set_filter(arg);
      }
    }

    ListFlowsResponse resp;
    auto              status = query_stub->ListFlows(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& f : resp.flows()) PrintFlow(f);
    std::cout << "total=" << resp.total() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "headers") {
    SearchHeadersRequest req;
    for (const auto& arg : args) {
      if (arg == "--regex") {
        req.set_mode(HEADER_MATCH_REGEX);
      } else if (arg == "--request") {
        req.set_direction(HEADER_DIRECTION_REQUEST);
      } else if (arg == "--response") {
        req.set_direction(HEADER_DIRECTION_RESPONSE);
      } else if (StartsWith(arg, "--mid=")) {
        req.set_mid(arg.substr(6));
      } else {
        req.set_pattern(arg);
      }
    }

    SearchHeadersResponse resp;
    auto                  status = query_stub->SearchHeaders(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& h : resp.headers()) {
      std::cout << h.mid() << '\t' << (h.direction() == HEADER_DIRECTION_RESPONSE ? "response" : "request") << '\t' << h.kv() << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
