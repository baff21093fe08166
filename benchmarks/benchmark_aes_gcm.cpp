/**
 * @file benchmark_aes_gcm.cpp
 * @brief AES-256-GCM Performance Benchmark: gcm256 vs OpenSSL
 *
 * Benchmarks authenticated encryption/decryption throughput for:
 * - Various data sizes (1KB, 64KB, 1MB)
 * - Encryption and decryption operations separately
 * - Authentication tag verification
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <iostream>
#include <iomanip>
#include <chrono>
#include <vector>
#include <cstring>
#include <algorithm>
#include <numeric>
#include <functional>
#include <stdexcept>
#include <limits>
#include <string>

// OpenSSL headers
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "gcm256/gcm256.h"

// Benchmark configuration
constexpr size_t WARMUP_ITERATIONS = 3;
constexpr size_t BENCHMARK_ITERATIONS = 20;
constexpr size_t AES_KEY_SIZE = GCM256_AES256_KEY_SIZE;
constexpr size_t GCM_IV_SIZE = GCM256_GCM_NONCE_SIZE;
constexpr size_t GCM_TAG_SIZE = GCM256_GCM_TAG_SIZE;

// Test data sizes
const std::vector<size_t> TEST_SIZES = {
    1024,           // 1 KB
    64 * 1024,      // 64 KB
    1024 * 1024     // 1 MB
};

/**
 * @brief High-resolution timer
 */
using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double, std::milli>;

/**
 * @brief Generate random bytes using OpenSSL
 */
static void generate_random(uint8_t* buf, size_t len) {
    if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
        throw std::runtime_error("OpenSSL RAND_bytes failed");
    }
}

/**
 * @brief Calculate throughput in MB/s
 */
static double calculate_throughput(size_t bytes, double ms) {
    return (static_cast<double>(bytes) / (1024.0 * 1024.0)) / (ms / 1000.0);
}

/**
 * @brief OpenSSL AES-256-GCM encryption benchmark
 */
static double benchmark_openssl_aes_gcm_encrypt(
    const std::vector<uint8_t>& plaintext,
    const uint8_t* key,
    const uint8_t* iv,
    std::vector<uint8_t>& ciphertext,
    uint8_t* tag
) {
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) return std::numeric_limits<double>::infinity();

    ciphertext.resize(plaintext.size() + GCM_TAG_SIZE);
    int len = 0;
    int ciphertext_len = 0;

    auto start = Clock::now();

    EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr);
    EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, GCM_IV_SIZE, nullptr);
    EVP_EncryptInit_ex(ctx, nullptr, nullptr, key, iv);
    EVP_EncryptUpdate(ctx, ciphertext.data(), &len, plaintext.data(),
                      static_cast<int>(plaintext.size()));
    ciphertext_len = len;
    EVP_EncryptFinal_ex(ctx, ciphertext.data() + len, &len);
    ciphertext_len += len;
    EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, GCM_TAG_SIZE, tag);

    auto end = Clock::now();
    Duration elapsed = end - start;

    ciphertext.resize(static_cast<size_t>(ciphertext_len));
    EVP_CIPHER_CTX_free(ctx);

    return elapsed.count();
}

/**
 * @brief OpenSSL AES-256-GCM decryption benchmark
 */
static double benchmark_openssl_aes_gcm_decrypt(
    const std::vector<uint8_t>& ciphertext,
    const uint8_t* key,
    const uint8_t* iv,
    const uint8_t* tag,
    std::vector<uint8_t>& plaintext
) {
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) return std::numeric_limits<double>::infinity();

    plaintext.resize(ciphertext.size());
    int len = 0;
    int plaintext_len = 0;

    auto start = Clock::now();

    EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr);
    EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, GCM_IV_SIZE, nullptr);
    EVP_DecryptInit_ex(ctx, nullptr, nullptr, key, iv);
    EVP_DecryptUpdate(ctx, plaintext.data(), &len, ciphertext.data(),
                      static_cast<int>(ciphertext.size()));
    plaintext_len = len;
    EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, GCM_TAG_SIZE,
                        const_cast<uint8_t*>(tag));
    int ret = EVP_DecryptFinal_ex(ctx, plaintext.data() + len, &len);

    auto end = Clock::now();
    Duration elapsed = end - start;

    EVP_CIPHER_CTX_free(ctx);
    if (ret <= 0) return std::numeric_limits<double>::infinity();

    plaintext_len += len;
    plaintext.resize(static_cast<size_t>(plaintext_len));
    return elapsed.count();
}

/**
 * @brief Run benchmark iterations and print average throughput
 */
static void run_benchmark_iterations(
    const std::string& name,
    const std::string& impl,
    size_t data_size,
    std::function<double()> benchmark_func
) {
    std::vector<double> times;
    times.reserve(BENCHMARK_ITERATIONS);

    // Warmup
    for (size_t i = 0; i < WARMUP_ITERATIONS; ++i) {
        benchmark_func();
    }

    for (size_t i = 0; i < BENCHMARK_ITERATIONS; ++i) {
        times.push_back(benchmark_func());
    }

    double avg = std::accumulate(times.begin(), times.end(), 0.0) / static_cast<double>(times.size());
    double best = *std::min_element(times.begin(), times.end());
    double throughput = calculate_throughput(data_size, avg);

    std::cout << std::left << std::setw(25) << name
              << std::setw(15) << impl
              << std::right << std::fixed << std::setprecision(2)
              << std::setw(10) << throughput << " MB/s"
              << std::setw(10) << avg << " ms"
              << std::setw(10) << best << " ms"
              << std::endl;
}

/**
 * @brief Main AES-GCM benchmark function
 */
static void benchmark_aes_gcm() {
    std::cout << "\n" << std::string(80, '=') << std::endl;
    std::cout << "  AES-256-GCM Benchmark (gcm256 " << gcm256_version()
              << ", " << gcm256_platform() << ")" << std::endl;
    std::cout << std::string(80, '=') << std::endl;

    uint8_t key[AES_KEY_SIZE];
    uint8_t iv[GCM_IV_SIZE];
    uint8_t tag[GCM_TAG_SIZE];
    generate_random(key, AES_KEY_SIZE);
    generate_random(iv, GCM_IV_SIZE);

    gcm256_aes_ctx_t aes_ctx;
    if (gcm256_aes_init(&aes_ctx, key, AES_KEY_SIZE) != GCM256_SUCCESS) {
        throw std::runtime_error("gcm256 AES init failed");
    }

    for (size_t data_size : TEST_SIZES) {
        std::string size_str;
        if (data_size >= 1024 * 1024) {
            size_str = std::to_string(data_size / (1024 * 1024)) + " MB";
        } else {
            size_str = std::to_string(data_size / 1024) + " KB";
        }

        std::cout << "\n--- Data Size: " << size_str << " ---" << std::endl;
        std::cout << std::left << std::setw(25) << "Operation"
                  << std::setw(15) << "Implementation"
                  << std::right << std::setw(15) << "Throughput"
                  << std::setw(13) << "Avg Time"
                  << std::setw(13) << "Best"
                  << std::endl;
        std::cout << std::string(80, '-') << std::endl;

        std::vector<uint8_t> plaintext(data_size);
        std::vector<uint8_t> ciphertext;
        std::vector<uint8_t> decrypted;
        generate_random(plaintext.data(), data_size);

        // Reference ciphertext/tag for the decrypt runs
        std::vector<uint8_t> ref_ciphertext(data_size);
        uint8_t ref_tag[GCM_TAG_SIZE] = {0};
        if (gcm256_gcm_encrypt(&aes_ctx, iv, GCM_IV_SIZE, nullptr, 0,
                               plaintext.data(), data_size,
                               ref_ciphertext.data(), ref_tag) != GCM256_SUCCESS) {
            throw std::runtime_error("gcm256 AES-GCM encrypt precompute failed");
        }

        run_benchmark_iterations(
            "AES-256-GCM Encrypt", "OpenSSL", data_size,
            [&]() {
                return benchmark_openssl_aes_gcm_encrypt(
                    plaintext, key, iv, ciphertext, tag);
            }
        );

        run_benchmark_iterations(
            "AES-256-GCM Decrypt", "OpenSSL", data_size,
            [&]() {
                return benchmark_openssl_aes_gcm_decrypt(
                    ref_ciphertext, key, iv, ref_tag, decrypted);
            }
        );

        run_benchmark_iterations(
            "AES-256-GCM Encrypt", "gcm256", data_size,
            [&]() {
                ciphertext.resize(data_size);
                auto start = Clock::now();
                auto status = gcm256_gcm_encrypt(&aes_ctx, iv, GCM_IV_SIZE,
                                                 nullptr, 0,
                                                 plaintext.data(), data_size,
                                                 ciphertext.data(), tag);
                auto end = Clock::now();
                if (status != GCM256_SUCCESS) {
                    return std::numeric_limits<double>::infinity();
                }
                Duration elapsed = end - start;
                return elapsed.count();
            }
        );

        run_benchmark_iterations(
            "AES-256-GCM Decrypt", "gcm256", data_size,
            [&]() {
                decrypted.resize(data_size);
                auto start = Clock::now();
                auto status = gcm256_gcm_decrypt(&aes_ctx, iv, GCM_IV_SIZE,
                                                 nullptr, 0,
                                                 ref_ciphertext.data(), data_size,
                                                 ref_tag, GCM_TAG_SIZE,
                                                 decrypted.data());
                auto end = Clock::now();
                if (status != GCM256_SUCCESS) {
                    return std::numeric_limits<double>::infinity();
                }
                Duration elapsed = end - start;
                return elapsed.count();
            }
        );
    }

    gcm256_aes_clear(&aes_ctx);
}

int main() {
    try {
        benchmark_aes_gcm();
    } catch (const std::exception& e) {
        std::cerr << "Benchmark failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
