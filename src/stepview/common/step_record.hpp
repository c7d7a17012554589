/**
 * @file step_record.hpp
 */
#pragma once
#include "stepview/common/common.hpp"
#include "stepview/common/step_id.hpp"

#include <map>

namespace stepview
{

// ============================================================================
// Edges
// ============================================================================

/**
 * @brief Reference to a port on a neighboring step.
 *
 * @details
 * In `edges_i` the reference names a producer (the remote step and its output
 * port). In `edges_o` it names a consumer (the remote step and its input port).
 */
struct EdgeRef
{
    StepId step;
    std::string port;
};

/**
 * @brief Edges of one port, in the order the graph resolver listed them.
 */
using EdgeList = std::vector<EdgeRef>;

/**
 * @brief Mapping from a local port name to its edges.
 * @details A port absent from the map has no edges.
 */
using EdgeMap = std::map<std::string, EdgeList>;

/**
 * @brief Look up the edges of a port.
 * @return The port's edges, or an empty list if the port has none.
 */
const EdgeList& edges_of(const EdgeMap& edges, const std::string& port);

// ============================================================================
// Parameters
// ============================================================================

/**
 * @brief A parameter value: a scalar or an ordered list of scalars.
 *
 * @details
 * Scalars are kept as the text written in the configuration source so the
 * listing prints them exactly as the user wrote them.
 */
using ParameterValue = std::variant<std::string, std::vector<std::string>>;

/**
 * @brief Parameters in document order, as (name, value).
 */
using ParameterList = std::vector<std::pair<std::string, ParameterValue>>;

// ============================================================================
// StepRecord
// ============================================================================

/**
 * @brief A resolved step, ready to be rendered.
 *
 * @details
 * `StepRecord` is produced once by `load_step_record()` and consumed once by
 * the renderer. Nothing in the renderer modifies it.
 *
 * @par Optional members
 * - `inputs`, `outputs`, `edges_i`, `edges_o` default to empty.
 * - `parameters` and `sandbox` are `std::nullopt` when the source does not
 *   mention them; the listing omits the corresponding section.
 *
 * @par Consistency
 * Every key of `edges_i` should appear in `inputs` and every key of
 * `edges_o` in `outputs`. Keys that do not are never rendered.
 */
struct StepRecord
{
    std::string name;

    /// Input port names in declared order.
    std::vector<std::string> inputs;

    /// Output port names in declared order.
    std::vector<std::string> outputs;

    /// Producers feeding each input port.
    EdgeMap edges_i;

    /// Consumers of each output port.
    EdgeMap edges_o;

    std::optional<ParameterList> parameters;

    std::optional<bool> sandbox;

    /// Path of the step's source directory.
    std::string source;
};

} // namespace stepview
