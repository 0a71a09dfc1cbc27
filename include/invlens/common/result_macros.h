#pragma once

#include "invlens/common/result.h"

// Helper to generate unique variable names
#define INVLENS_CONCAT_IMPL(x, y) x##y
#define INVLENS_CONCAT(x, y) INVLENS_CONCAT_IMPL(x, y)
#define INVLENS_UNIQUE_VAR INVLENS_CONCAT(_result_, __LINE__)

// RETURN_ON_ERROR: Result<T> 带错误时直接返回其 Status
#define RETURN_ON_ERROR(result)           \
    do {                                  \
        auto&& INVLENS_UNIQUE_VAR = (result); \
        if (INVLENS_UNIQUE_VAR.hasError()) \
            return INVLENS_UNIQUE_VAR.error(); \
    } while (0)

// RETURN_IF_NOT_OK: Status 版本
#define RETURN_IF_NOT_OK(status)          \
    do {                                  \
        auto&& INVLENS_UNIQUE_VAR = (status); \
        if (!INVLENS_UNIQUE_VAR.OK())     \
            return INVLENS_UNIQUE_VAR;    \
    } while (0)

// ASSIGN_OR_RETURN: Assign value or return error
#define ASSIGN_OR_RETURN(var, result)     \
    auto&& INVLENS_CONCAT(_tmp_, __LINE__) = (result); \
    if (INVLENS_CONCAT(_tmp_, __LINE__).hasError()) \
        return INVLENS_CONCAT(_tmp_, __LINE__).error(); \
    var = std::move(INVLENS_CONCAT(_tmp_, __LINE__)).value()
