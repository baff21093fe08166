/**
 * @file export.cpp
 * @brief Library identification and error strings
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "gcm256/core/common.h"
#include "gcm256/version.h"

extern "C" {

const char* gcm256_version(void) {
    return GCM256_VERSION_STRING;
}

const char* gcm256_platform(void) {
    return GCM256_PLATFORM_NAME;
}

const char* gcm256_error_string(gcm256_error_t error) {
    switch (error) {
        case GCM256_SUCCESS:
            return "Success";
        case GCM256_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case GCM256_ERROR_INVALID_KEY:
            return "Invalid key";
        case GCM256_ERROR_INVALID_IV:
            return "Invalid IV";
        case GCM256_ERROR_INVALID_TAG:
            return "Invalid tag length";
        case GCM256_ERROR_INVALID_BLOCK_SIZE:
            return "Invalid block size";
        case GCM256_ERROR_LENGTH_LIMIT:
            return "Input length limit exceeded";
        case GCM256_ERROR_INVALID_STATE:
            return "Invalid state";
        case GCM256_ERROR_AUTH_FAILED:
            return "Authentication failed";
        case GCM256_ERROR_RANDOM_FAILED:
            return "Random generation failed";
        case GCM256_ERROR_NONCE_EXHAUSTED:
            return "Nonce sequence exhausted";
        default:
            return "Unknown error";
    }
}

} // extern "C"
