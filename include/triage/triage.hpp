#pragma once

/** \file triage.hpp
 *  \brief Umbrella header for the triage library.
 */

#include "triage/casefile.hpp"
#include "triage/classify.hpp"
#include "triage/config.hpp"
#include "triage/dispatcher.hpp"
#include "triage/error.hpp"
#include "triage/error_id.hpp"
#include "triage/failure.hpp"
#include "triage/rule_book.hpp"
#include "triage/scope.hpp"
#include "triage/stack_trace.hpp"
