#ifndef MOREITER_MOREITER_HPP_
#define MOREITER_MOREITER_HPP_

#if __cplusplus < 201703L && !(defined(_MSVC_LANG) && _MSVC_LANG >= 201703L)
#error "moreiter requires C++17 or later"
#endif

#include "capabilities.hpp"
#include "errors.hpp"
#include "first.hpp"
#include "first_true.hpp"
#include "head.hpp"
#include "last.hpp"
#include "length.hpp"
#include "n_cycles.hpp"
#include "nth.hpp"
#include "pairwise.hpp"
#include "partition.hpp"
#include "prepend.hpp"
#include "quantify.hpp"
#include "registry.hpp"
#include "repeat_func.hpp"
#include "reverse_iter.hpp"
#include "round_robin.hpp"
#include "unique_everseen.hpp"
#include "unique_justseen.hpp"

#endif
