#ifndef __AIC_TEST_HEADERS_HPP__
#define __AIC_TEST_HEADERS_HPP__

#include "Headers.hpp"

#include "catch2/catch.hpp"

#endif  // __AIC_TEST_HEADERS_HPP__
