#ifndef INCLUDED_UTILITY_MACRO_DEFINITIONS
#define INCLUDED_UTILITY_MACRO_DEFINITIONS

#define UTILITY_CONCATENATE_MACRO_IMPL(a, b) a##b
#define UTILITY_CONCATENATE_MACRO(a, b)      UTILITY_CONCATENATE_MACRO_IMPL(a, b)

#define UTILITY_STRINGIFY_MACRO_IMPL(a) #a
#define UTILITY_STRINGIFY_MACRO(a)      UTILITY_STRINGIFY_MACRO_IMPL(a)

#endif // INCLUDED_UTILITY_MACRO_DEFINITIONS
