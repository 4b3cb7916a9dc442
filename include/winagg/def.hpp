#pragma once

#ifndef WINAGG_NO_UNIQUE_ADDRESS
#if defined(_MSC_VER)
// [[no_unique_address]] is ignored by MSVC even in C++20 mode; instead, [[msvc::no_unique_address]] is provided.
// Ref: https://en.cppreference.com/w/cpp/language/attributes/no_unique_address
#define WINAGG_NO_UNIQUE_ADDRESS [[msvc::no_unique_address]]
#else
#define WINAGG_NO_UNIQUE_ADDRESS [[no_unique_address]]
#endif
#endif
