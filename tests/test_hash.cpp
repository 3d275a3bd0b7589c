#include "test_utils.h"
#include "../src/flat_matrix.hpp"
#include "../src/result_hash.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace TestUtils;

bool test_sha256_empty() {
    return sha256::hash("") ==
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
}

bool test_sha256_abc() {
    return sha256::hash("abc") ==
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
}

bool test_sha256_two_blocks() {
    // 448-bit message, padding spills into a second block
    return sha256::hash("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
        "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1";
}

bool test_sha256_streaming_matches_one_shot() {
    std::string message;
    for (int i = 0; i < 1000; ++i) {
        message += static_cast<char>('a' + (i % 26));
    }
    const std::string expected = sha256::hash(message);

    const size_t chunk_sizes[] = {1, 7, 63, 64, 65, 333};
    for (size_t chunk : chunk_sizes) {
        sha256::Hasher hasher;
        for (size_t pos = 0; pos < message.size(); pos += chunk) {
            const size_t len = std::min(chunk, message.size() - pos);
            hasher.update(message.data() + pos, len);
        }
        TEST_CHECK(hasher.hex_digest() == expected);
    }
    return true;
}

bool test_result_hash_little_endian_bytes() {
    // 1.0f is 00 00 80 3f in little-endian order
    FlatMatrix m(std::vector<float>{1.0f}, 1, 1);
    const std::string bytes("\x00\x00\x80\x3f", 4);
    return compute_result_hash(m) == sha256::hash(bytes);
}

bool test_result_hash_row_major() {
    FlatMatrix m = FlatMatrix::from_rows({{1.0f, 2.0f}, {3.0f, 4.0f}});
    FlatMatrix transposed = FlatMatrix::from_rows({{1.0f, 3.0f}, {2.0f, 4.0f}});
    const std::string bytes("\x00\x00\x80\x3f" "\x00\x00\x00\x40"
                            "\x00\x00\x40\x40" "\x00\x00\x80\x40", 16);
    TEST_CHECK(compute_result_hash(m) == sha256::hash(bytes));
    TEST_CHECK(compute_result_hash(m) != compute_result_hash(transposed));
    return true;
}

bool test_result_hash_empty_matrix() {
    FlatMatrix empty;
    return compute_result_hash(empty) == sha256::hash("");
}

bool test_result_hash_format() {
    FlatMatrix m(std::vector<float>{-0.5f, 7.25f}, 1, 2);
    const std::string h = compute_result_hash(m);
    TEST_CHECK(h.size() == 64);
    for (char c : h) {
        TEST_CHECK((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
    }
    return true;
}

int main() {
    TestRunner runner("Result Hash Tests");

    runner.run_test("SHA-256 empty input", test_sha256_empty());
    runner.run_test("SHA-256 abc", test_sha256_abc());
    runner.run_test("SHA-256 two-block message", test_sha256_two_blocks());
    runner.run_test("SHA-256 streaming chunks", test_sha256_streaming_matches_one_shot());
    runner.run_test("Result hash uses little-endian f32 bytes", test_result_hash_little_endian_bytes());
    runner.run_test("Result hash is row-major", test_result_hash_row_major());
    runner.run_test("Result hash of empty matrix", test_result_hash_empty_matrix());
    runner.run_test("Result hash is lowercase hex", test_result_hash_format());

    runner.print_summary();
    return runner.all_passed() ? 0 : 1;
}
