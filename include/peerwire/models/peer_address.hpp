#pragma once
#include <cstdint>
#include <string>
#include <vector>
namespace peerwire::models {
/// A remote node as already resolved by the caller.
struct PeerAddress {
    std::vector<uint8_t> node_id;
    std::string host;
    uint16_t port = 0;
};
}
