#pragma once

/** \file schema_descriptor.hpp
 *  \brief Fetch the ordered column descriptors of a dataset through the engine.
 */

#include <expected>
#include <vector>

#include "grainguard/dataset_store.hpp"
#include "grainguard/engine/query_engine.hpp"
#include "grainguard/error.hpp"
#include "grainguard/schema.hpp"

namespace grainguard {

/** \brief Describe the dataset behind an open session. */
auto describe(engine::engine_session& session)
    -> std::expected<std::vector<column_descriptor>, core::error>;

/** \brief Open a short-lived session and describe the dataset.
 *
 * \return columns in engine order; dataset_not_found when the handle no longer
 *         resolves to a stored file; schema_unavailable when the engine cannot
 *         parse the file's structure.
 */
auto describe(engine::query_engine& engine, const dataset_handle& dataset)
    -> std::expected<std::vector<column_descriptor>, core::error>;

} // namespace grainguard
