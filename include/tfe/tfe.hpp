#pragma once

/// @file tfe.hpp
/// @brief Umbrella header for the tennis feature engine.

#include "tfe/version.hpp"
#include "tfe/core/result.hpp"

#include "tfe/foundation/config_manager.hpp"
#include "tfe/foundation/engine_logger.hpp"
#include "tfe/foundation/engine_result.hpp"
#include "tfe/foundation/time_utils.hpp"
#include "tfe/foundation/types.hpp"

#include "tfe/rating/elo_rating_tracker.hpp"
#include "tfe/rating/head_to_head_tracker.hpp"
#include "tfe/rating/player_form_tracker.hpp"
#include "tfe/rating/ranking_lookup.hpp"
#include "tfe/rating/rating_types.hpp"

#include "tfe/features/feature_assembler.hpp"
#include "tfe/features/feature_vector.hpp"
#include "tfe/features/player_registry.hpp"

#include "tfe/ingest/csv_source.hpp"
#include "tfe/ingest/match_stream.hpp"

#include "tfe/persistence/elo_table_validator.hpp"
#include "tfe/persistence/feature_table_writer.hpp"

#include "tfe/replay/chronological_orchestrator.hpp"
#include "tfe/replay/engine_config.hpp"
#include "tfe/replay/live_query_adapter.hpp"
#include "tfe/replay/replay_runner.hpp"
#include "tfe/replay/tracker_snapshot.hpp"
