#include "test_utils.h"
#include "../src/seeded_generator.hpp"
#include "../src/types.hpp"
#include <string>
#include <vector>

using namespace TestUtils;

namespace {

bool throws_invalid_seed(const std::string& hex) {
    try {
        decode_hex_seed(hex);
    } catch (const SolverError& e) {
        return e.kind() == ErrorKind::InvalidSeed;
    }
    return false;
}

} // namespace

// BLAKE3("") = af1349b9 f5f9a1a6 a0404dea ...
bool test_empty_seed_known_prefix() {
    MatrixPair pair = generate_seeded_pair_hex("", 1, 4, 1, 4);
    const FlatMatrix& a = pair.first;
    const FlatMatrix& b = pair.second;
    TEST_CHECK(a.rows == 1 && a.cols == 4);
    TEST_CHECK(b.rows == 1 && b.cols == 4);

    const float expected_a[] = {175.0f, 19.0f, 73.0f, 185.0f};
    // 0xf5 0xf9 0xa1 0xa6 shifted down by 128
    const float expected_b[] = {117.0f, 121.0f, 33.0f, 38.0f};
    for (size_t i = 0; i < 4; ++i) {
        TEST_CHECK(a.data[i] == expected_a[i]);
        TEST_CHECK(b.data[i] == expected_b[i]);
    }
    return true;
}

bool test_stream_is_split_in_order() {
    // B continues the output stream right where A stops
    MatrixPair whole = generate_seeded_pair_hex("", 1, 8, 0, 0);
    MatrixPair split = generate_seeded_pair_hex("", 1, 4, 1, 4);
    for (size_t i = 0; i < 4; ++i) {
        TEST_CHECK(whole.first.data[i] == split.first.data[i]);
        TEST_CHECK(whole.first.data[4 + i] - 128.0f == split.second.data[i]);
    }
    TEST_CHECK(whole.second.empty());
    return true;
}

bool test_deterministic() {
    MatrixPair first = generate_seeded_pair_hex("00ff10aa", 16, 257, 257, 16);
    MatrixPair second = generate_seeded_pair_hex("00FF10AA", 16, 257, 257, 16);
    TEST_CHECK(first.first.data == second.first.data);
    TEST_CHECK(first.second.data == second.second.data);
    return true;
}

bool test_different_seeds_differ() {
    MatrixPair a = generate_seeded_pair_hex("01", 4, 64, 64, 4);
    MatrixPair b = generate_seeded_pair_hex("02", 4, 64, 64, 4);
    TEST_CHECK(a.first.data != b.first.data);
    TEST_CHECK(a.second.data != b.second.data);
    return true;
}

bool test_value_ranges() {
    MatrixPair pair = generate_seeded_pair_hex("deadbeef", 16, 1000, 1000, 16);
    bool saw_low_a = false;
    bool saw_negative_b = false;
    for (float v : pair.first.data) {
        TEST_CHECK(v >= 0.0f && v <= 255.0f);
        TEST_CHECK(v == static_cast<float>(static_cast<int>(v)));
        if (v < 128.0f) saw_low_a = true;
    }
    for (float v : pair.second.data) {
        TEST_CHECK(v >= -128.0f && v <= 127.0f);
        TEST_CHECK(v == static_cast<float>(static_cast<int>(v)));
        if (v < 0.0f) saw_negative_b = true;
    }
    TEST_CHECK(saw_low_a);
    TEST_CHECK(saw_negative_b);
    return true;
}

bool test_shapes() {
    MatrixPair pair = generate_seeded_pair_hex("aa", 3, 5, 5, 7);
    TEST_CHECK(pair.first.rows == 3 && pair.first.cols == 5 && pair.first.size() == 15);
    TEST_CHECK(pair.second.rows == 5 && pair.second.cols == 7 && pair.second.size() == 35);

    MatrixPair empty = generate_seeded_pair_hex("aa", 0, 5, 0, 7);
    TEST_CHECK(empty.first.rows == 0 && empty.first.cols == 0 && empty.first.empty());
    TEST_CHECK(empty.second.rows == 0 && empty.second.cols == 0 && empty.second.empty());
    return true;
}

bool test_byte_seed_matches_hex_seed() {
    const std::vector<uint8_t> seed = {0x12, 0x34, 0xab};
    MatrixPair from_bytes = generate_seeded_pair(seed, 2, 9, 9, 2);
    MatrixPair from_hex = generate_seeded_pair_hex("1234ab", 2, 9, 9, 2);
    TEST_CHECK(from_bytes.first.data == from_hex.first.data);
    TEST_CHECK(from_bytes.second.data == from_hex.second.data);
    return true;
}

bool test_decode_hex_seed() {
    std::vector<uint8_t> bytes = decode_hex_seed("00fFa5");
    TEST_CHECK(bytes.size() == 3);
    TEST_CHECK(bytes[0] == 0x00 && bytes[1] == 0xff && bytes[2] == 0xa5);
    TEST_CHECK(decode_hex_seed("").empty());
    return true;
}

bool test_invalid_seeds() {
    TEST_CHECK(throws_invalid_seed("abc"));
    TEST_CHECK(throws_invalid_seed("zz"));
    TEST_CHECK(throws_invalid_seed("0g"));
    TEST_CHECK(throws_invalid_seed("0x12"));
    try {
        generate_seeded_pair_hex("1", 1, 1, 1, 1);
        return false;
    } catch (const SolverError& e) {
        TEST_CHECK(e.kind() == ErrorKind::InvalidSeed);
    }
    return true;
}

bool test_oversized_request_rejected() {
    try {
        generate_seeded_pair_hex("", SIZE_MAX, 2, 1, 1);
        return false;
    } catch (const SolverError& e) {
        return e.kind() == ErrorKind::MalformedInput;
    }
}

int main() {
    TestRunner runner("Seeded Generator Tests");

    runner.run_test("Empty seed known prefix", test_empty_seed_known_prefix());
    runner.run_test("Stream split order", test_stream_is_split_in_order());
    runner.run_test("Deterministic generation", test_deterministic());
    runner.run_test("Different seeds differ", test_different_seeds_differ());
    runner.run_test("Value ranges", test_value_ranges());
    runner.run_test("Matrix shapes", test_shapes());
    runner.run_test("Byte seed matches hex seed", test_byte_seed_matches_hex_seed());
    runner.run_test("Hex seed decoding", test_decode_hex_seed());
    runner.run_test("Invalid seeds rejected", test_invalid_seeds());
    runner.run_test("Oversized request rejected", test_oversized_request_rejected());

    runner.print_summary();
    return runner.all_passed() ? 0 : 1;
}
