/**
 * @file connector_stack.hpp
 * @brief Labeled connector lines above and below the step box.
 */
#pragma once
#include "stepview/common/common.hpp"
#include "stepview/common/step_record.hpp"
#include "stepview/render/render_enums.hpp"

namespace stepview
{

/**
 * @brief Per-port column states of one connector line.
 *
 * @details
 * `ColumnBuffer` maps each port to the column of its marker in the arrow row
 * and keeps one `ColumnState` per port. Connector lines are produced by
 * changing states by port index and rendering the buffer.
 *
 * @par Invariants
 * - A port without edges stays `Absent`; `set()` ignores it.
 * - A rendered line is as wide as the arrow row.
 */
class ColumnBuffer
{
public:
    /**
     * @brief Construct a ColumnBuffer.
     * @param arrow_row Arrow row of the side being drawn.
     * @param has_edges For each port in declared order, whether it has edges.
     * @throw std::invalid_argument if the arrow row does not hold exactly one
     *        marker per port.
     */
    ColumnBuffer(const std::string& arrow_row, std::vector<bool> has_edges);

    size_t port_count() const noexcept
    {
        return m_states.size();
    }

    bool has_edges(PortIdx port) const
    {
        return m_has_edges.at(port);
    }

    ColumnState state(PortIdx port) const
    {
        return m_states.at(port);
    }

    /**
     * @brief Set the state of one port's column.
     */
    void set(PortIdx port, ColumnState state);

    /**
     * @brief Set the state of every port that has edges.
     */
    void set_all(ColumnState state);

    /**
     * @brief Render the buffer as a connector line.
     */
    std::string render() const;

    /**
     * @brief Render the buffer followed by a space and a label.
     */
    std::string render(const std::string& label) const;

private:
    size_t m_width;
    std::vector<size_t> m_columns;
    std::vector<bool> m_has_edges;
    std::vector<ColumnState> m_states;
};

/**
 * @brief Get whether each port has at least one edge.
 * @param ports Port names in declared order.
 * @param edges The edge map of the same side.
 */
std::vector<bool> ports_with_edges(const std::vector<std::string>& ports, const EdgeMap& edges);

/**
 * @brief Order the consumers of one output port by step ordering prefix.
 * @details The sort is stable; see `precedes_by_order()`.
 */
EdgeList sorted_consumers(const EdgeList& consumers);

/**
 * @brief Build the connector lines drawn above the box.
 *
 * @details
 * Ports are visited in declared order. Each producer of a port adds a line
 * with the producer's step id, a line with its port name, and a trunk line.
 * Columns of earlier ports carry trunks, columns of later ports stay blank
 * until their turn. The last line is the arrow row touching the box and is
 * always present.
 *
 * @param inputs Input port names in declared order.
 * @param edges_i Producers of each input port.
 * @param arrow_row Arrow row of the centered inputs header.
 * @return Lines in print order, top to bottom.
 */
std::vector<std::string> build_input_connectors(const std::vector<std::string>& inputs,
                                                const EdgeMap& edges_i,
                                                const std::string& arrow_row);

/**
 * @brief Build the connector lines drawn below the box.
 *
 * @details
 * Ports are visited in declared order, consumers of a port in
 * `sorted_consumers()` order. Each consumer adds a marker line (an arrow for
 * the first consumer, a trunk for the others), a line with the consumer's
 * step id, and a line with its port name. Trunks of ports still waiting to
 * be labeled run down the right-hand columns; columns of ports already
 * labeled end.
 *
 * @param outputs Output port names in declared order.
 * @param edges_o Consumers of each output port.
 * @param arrow_row Arrow row of the centered outputs header.
 * @return Lines in print order, top to bottom.
 */
std::vector<std::string> build_output_connectors(const std::vector<std::string>& outputs,
                                                 const EdgeMap& edges_o,
                                                 const std::string& arrow_row);

/**
 * @brief Build the two generic rows of simple mode: a pipe row, then the
 *        arrow row.
 */
std::vector<std::string> build_simple_connectors(const std::string& arrow_row);

} // namespace stepview
