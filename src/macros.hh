#pragma once

#include "logger.hh"

#include <stdexcept>

#define EXPECT(e, ...)                                                         \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw std::runtime_error(__err);                                   \
        }                                                                      \
    } while (0)
#define CHECK(e) EXPECT(e, "Expression evaluated as false:\n\t", #e)

// Like EXPECT, but throws one of the chunkstore error types.
#define EXPECT_OR_RAISE(e, error_type, ...)                                    \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw error_type(__err);                                           \
        }                                                                      \
    } while (0)
#define EXPECT_GOOD_CHUNK(e, ...)                                              \
    EXPECT_OR_RAISE(e, chunkstore::BadChunk, __VA_ARGS__)
