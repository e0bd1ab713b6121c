/*
 * File: debug.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-18
 * License: MIT
 */


#pragma once

#ifndef TARS_ASSERT
#include <cassert>
#define TARS_ASSERT(cond, msg) do { static_cast<void>(msg); assert(cond); } while(0)
#endif

#ifdef ENABLE_PRIVATE_TESTS
#define PRIVATE_TESTABLE public
#else
#define PRIVATE_TESTABLE private
#endif
