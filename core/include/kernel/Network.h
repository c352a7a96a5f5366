#ifndef NETWORK_H
#define NETWORK_H

#include <cstdint>
#include <random>
#include <utility>
#include <vector>

/**
 * Fixed social graph shared by all phases of one simulation.
 *
 * Nodes are agent ids 0..N-1. Edges are undirected and stored as per-node
 * adjacency lists; the position of a neighbor inside a list is its "slot",
 * which parallel per-edge arrays (prestige weights) index by.
 *
 * Edges may only be added while the graph is open. finalize() computes the
 * all-pairs shortest-path table and freezes the edge set.
 */
class Network {
public:
    static constexpr std::uint32_t kUnreachable = 0xFFFFFFFFu;

    Network() = default;
    explicit Network(std::uint32_t nodes);

    // Watts-Strogatz: ring lattice with k neighbors (k even), each forward
    // edge rewired with probability p. Leaves the graph finalized.
    static Network wattsStrogatz(std::uint32_t N, std::uint32_t k, double p, std::mt19937_64& rng);

    // Graph from an explicit edge list supplied by an external generator.
    static Network fromEdges(std::uint32_t N,
                             const std::vector<std::pair<std::uint32_t, std::uint32_t>>& edges);

    // Returns false for an edge that already exists. Throws on self loops,
    // out-of-range ids, or a finalized graph.
    bool addEdge(std::uint32_t a, std::uint32_t b);
    void finalize();
    bool finalized() const { return finalized_; }

    std::uint32_t size() const { return static_cast<std::uint32_t>(adj_.size()); }
    std::size_t edgeCount() const { return edges_; }

    const std::vector<std::uint32_t>& neighbors(std::uint32_t node) const { return adj_[node]; }
    bool hasEdge(std::uint32_t a, std::uint32_t b) const { return slotOf(a, b) >= 0; }

    // Position of b in a's adjacency list, or -1.
    int slotOf(std::uint32_t a, std::uint32_t b) const;

    // Shortest-path length in hops; kUnreachable when disconnected.
    std::uint32_t hops(std::uint32_t a, std::uint32_t b) const;
    // Same as hops() but +inf when disconnected.
    double distance(std::uint32_t a, std::uint32_t b) const;

private:
    std::vector<std::vector<std::uint32_t>> adj_;
    std::vector<std::uint32_t> dist_;   // N*N row-major, filled by finalize()
    std::size_t edges_ = 0;
    bool finalized_ = false;

    void removeEdge(std::uint32_t a, std::uint32_t b);
    void computeDistances();
};

#endif
