#include "segxfer/checksum.hpp"

#include <cassert>
#include <string>
#include <vector>

int main() {
    std::vector<char> data{'a', 'b', 'c'};
    auto hex = segxfer::Checksum::sha256_hex(data);
    assert(hex == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(segxfer::Checksum::sha256_hex(std::string("abc")) == hex);
    assert(segxfer::Checksum::sha256_hex(std::string()) ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    segxfer::Checksum::Sha256Accumulator accumulator;
    accumulator.update(data.data(), 2);
    // Reading the digest midway must not disturb the running state.
    assert(accumulator.hex() == segxfer::Checksum::sha256_hex(std::string("ab")));
    accumulator.update(data.data() + 2, data.size() - 2);
    accumulator.update(nullptr, 0);
    assert(accumulator.hex() == hex);

    segxfer::Checksum::Sha256Accumulator moved(std::move(accumulator));
    assert(moved.hex() == hex);
    return 0;
}
