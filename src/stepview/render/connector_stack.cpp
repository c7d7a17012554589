/**
 * @file connector_stack.cpp
 */
#include "stepview/render/connector_stack.hpp"
#include "stepview/render/arrow_row.hpp"

#include <algorithm>

namespace stepview
{

// ============================================================================
// ColumnBuffer
// ============================================================================

ColumnBuffer::ColumnBuffer(const std::string& arrow_row, std::vector<bool> has_edges)
    : m_width{arrow_row.size()}
    , m_columns{marker_columns(arrow_row, arrow_marker)}
    , m_has_edges{std::move(has_edges)}
    , m_states(m_has_edges.size(), ColumnState::Absent)
{
    if (m_columns.size() != m_has_edges.size())
    {
        throw std::invalid_argument(
            "Arrow row has " + std::to_string(m_columns.size()) + " markers for " +
            std::to_string(m_has_edges.size()) + " ports");
    }
    for (PortIdx port = 0; port < m_states.size(); ++port)
    {
        if (m_has_edges[port])
        {
            m_states[port] = ColumnState::Hidden;
        }
    }
}

void ColumnBuffer::set(PortIdx port, ColumnState state)
{
    if (m_has_edges.at(port))
    {
        m_states[port] = state;
    }
}

void ColumnBuffer::set_all(ColumnState state)
{
    for (PortIdx port = 0; port < m_states.size(); ++port)
    {
        set(port, state);
    }
}

std::string ColumnBuffer::render() const
{
    std::string line(m_width, ' ');
    for (PortIdx port = 0; port < m_states.size(); ++port)
    {
        line[m_columns[port]] = to_char(m_states[port]);
    }
    return line;
}

std::string ColumnBuffer::render(const std::string& label) const
{
    return render() + " " + label;
}

// ============================================================================
// Helpers
// ============================================================================

std::vector<bool> ports_with_edges(const std::vector<std::string>& ports, const EdgeMap& edges)
{
    std::vector<bool> result;
    result.reserve(ports.size());
    for (const auto& port : ports)
    {
        result.push_back(!edges_of(edges, port).empty());
    }
    return result;
}

EdgeList sorted_consumers(const EdgeList& consumers)
{
    EdgeList sorted = consumers;
    std::stable_sort(sorted.begin(), sorted.end(), [](const EdgeRef& lhs, const EdgeRef& rhs) {
        return precedes_by_order(lhs.step, rhs.step);
    });
    return sorted;
}

// ============================================================================
// Connector builders
// ============================================================================

std::vector<std::string> build_input_connectors(const std::vector<std::string>& inputs,
                                                const EdgeMap& edges_i,
                                                const std::string& arrow_row)
{
    std::vector<std::string> lines;
    ColumnBuffer buffer(arrow_row, ports_with_edges(inputs, edges_i));

    for (PortIdx port = 0; port < inputs.size(); ++port)
    {
        const EdgeList& producers = edges_of(edges_i, inputs[port]);
        if (producers.empty())
        {
            continue;
        }
        for (const auto& producer : producers)
        {
            buffer.set(port, ColumnState::Junction);
            lines.push_back(buffer.render(producer.step.text()));
            lines.push_back(buffer.render(producer.port));
            buffer.set(port, ColumnState::Trunk);
            lines.push_back(buffer.render());
        }
    }

    buffer.set_all(ColumnState::Arrow);
    lines.push_back(buffer.render());
    return lines;
}

std::vector<std::string> build_output_connectors(const std::vector<std::string>& outputs,
                                                 const EdgeMap& edges_o,
                                                 const std::string& arrow_row)
{
    std::vector<std::string> lines;
    ColumnBuffer buffer(arrow_row, ports_with_edges(outputs, edges_o));

    // Every trunk starts at the box; a port's trunk ends once it is labeled.
    buffer.set_all(ColumnState::Trunk);

    for (PortIdx port = 0; port < outputs.size(); ++port)
    {
        const EdgeList& consumers = edges_of(edges_o, outputs[port]);
        if (consumers.empty())
        {
            continue;
        }
        bool first = true;
        for (const auto& consumer : sorted_consumers(consumers))
        {
            buffer.set(port, first ? ColumnState::Arrow : ColumnState::Trunk);
            lines.push_back(buffer.render());
            buffer.set(port, ColumnState::Junction);
            lines.push_back(buffer.render(consumer.step.text()));
            lines.push_back(buffer.render(consumer.port));
            first = false;
        }
        buffer.set(port, ColumnState::Hidden);
    }
    return lines;
}

std::vector<std::string> build_simple_connectors(const std::string& arrow_row)
{
    return {remark(arrow_row, arrow_marker, trunk_marker), arrow_row};
}

} // namespace stepview
