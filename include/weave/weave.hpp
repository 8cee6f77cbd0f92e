#pragma once

/// @file weave.hpp
/// @brief Convenience header including the whole weave API

#include <weave/core/error.hpp>
#include <weave/core/id.hpp>
#include <weave/core/log.hpp>
#include <weave/graph/dependency_graph.hpp>
#include <weave/ledger/event.hpp>
#include <weave/ledger/ledger.hpp>
#include <weave/turn/turn.hpp>
#include <weave/cone/causal_cone.hpp>
#include <weave/govern/strategy.hpp>
#include <weave/govern/yield_handler.hpp>
#include <weave/engine/config.hpp>
#include <weave/engine/weave.hpp>
