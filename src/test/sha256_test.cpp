#include <cassert>
#include <iostream>
#include <string>

#include "utils/sha256.hpp"

using chatingest::SHA256;

int main() {
    std::cout << "[Test] Starting SHA-256 Test..." << std::endl;

    // FIPS 180-4 examples
    assert(SHA256::hash_hex("abc") ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(SHA256::hash_hex("") ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    assert(SHA256::hash_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
           "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");

    // Incremental updates across a block boundary match the one-shot hash
    std::string long_text(1000, 'a');
    SHA256 ctx;
    ctx.update(long_text.substr(0, 63));
    ctx.update(long_text.substr(63, 2));
    ctx.update(long_text.substr(65));
    assert(SHA256::to_hex(ctx.finalize()) == SHA256::hash_hex(long_text));

    std::cout << "[Test] Truncated tokens..." << std::endl;
    assert(SHA256::truncated_hex("abc", 12) == "ba7816bf8f01");
    assert(SHA256::truncated_hex("abc", 100).size() == 64);

    std::cout << "[PASS] SHA-256 Test." << std::endl;
    return 0;
}
