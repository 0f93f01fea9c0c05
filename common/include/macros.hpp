#pragma once

#define CONCAT_X(a, b) a##b
#define CONCAT(a, b) CONCAT_X(a, b)

#define UNIQUE_ID(prefix) CONCAT(prefix, __COUNTER__)
