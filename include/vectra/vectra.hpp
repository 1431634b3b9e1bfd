#pragma once

/** \file vectra.hpp
 *  \brief Umbrella header.
 */

#include "vectra/collection.hpp"
#include "vectra/collection_manager.hpp"
#include "vectra/config.hpp"
#include "vectra/engine.hpp"
#include "vectra/error.hpp"
#include "vectra/filter/filter_eval.hpp"
#include "vectra/filter/filter_expr.hpp"
#include "vectra/ingest/ingestion_pipeline.hpp"
#include "vectra/log.hpp"
#include "vectra/search/fusion.hpp"
#include "vectra/search/query_engine.hpp"
#include "vectra/types.hpp"
