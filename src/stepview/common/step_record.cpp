/**
 * @file step_record.cpp
 */
#include "stepview/common/step_record.hpp"

namespace stepview
{

const EdgeList& edges_of(const EdgeMap& edges, const std::string& port)
{
    static const EdgeList no_edges{};
    auto it = edges.find(port);
    if (it == edges.end())
    {
        return no_edges;
    }
    return it->second;
}

} // namespace stepview
