#include "kernel/Network.h"
#include <algorithm>
#include <deque>
#include <limits>
#include <stdexcept>
#include <string>

Network::Network(std::uint32_t nodes) : adj_(nodes) {}

Network Network::wattsStrogatz(std::uint32_t N, std::uint32_t k, double p, std::mt19937_64& rng) {
    Network net(N);
    if (k % 2) ++k;  // ensure even
    // Degree is capped at N-1: with halfK = N/2 on an even ring the opposite
    // node is reached from both sides and the duplicate add is a no-op
    const std::uint32_t halfK = N > 1 ? std::min(k / 2, N / 2) : 0;

    std::uniform_real_distribution<double> uniDist(0.0, 1.0);
    std::uniform_int_distribution<std::uint32_t> nodeDist(0, N > 0 ? N - 1 : 0);

    for (auto& nbrs : net.adj_) {
        nbrs.reserve(k);
    }

    // Ring lattice
    for (std::uint32_t d = 1; d <= halfK; ++d) {
        for (std::uint32_t i = 0; i < N; ++i) {
            net.addEdge(i, (i + d) % N);
        }
    }

    // Rewiring, one lattice distance at a time
    for (std::uint32_t d = 1; d <= halfK; ++d) {
        for (std::uint32_t i = 0; i < N; ++i) {
            if (uniDist(rng) >= p) continue;

            const std::uint32_t oldJ = (i + d) % N;
            if (!net.hasEdge(i, oldJ)) continue;
            // Fully connected node: nothing to rewire to
            if (net.adj_[i].size() >= N - 1) continue;

            std::uint32_t newJ;
            do {
                newJ = nodeDist(rng);
            } while (newJ == i || net.hasEdge(i, newJ));

            net.removeEdge(i, oldJ);
            net.addEdge(i, newJ);
        }
    }

    net.finalize();
    return net;
}

Network Network::fromEdges(std::uint32_t N,
                           const std::vector<std::pair<std::uint32_t, std::uint32_t>>& edges) {
    Network net(N);
    for (const auto& [a, b] : edges) {
        net.addEdge(a, b);
    }
    net.finalize();
    return net;
}

bool Network::addEdge(std::uint32_t a, std::uint32_t b) {
    if (finalized_) {
        throw std::logic_error("addEdge on a finalized network");
    }
    if (a >= adj_.size() || b >= adj_.size()) {
        throw std::invalid_argument("edge (" + std::to_string(a) + "," + std::to_string(b) +
                                    ") out of range for " + std::to_string(adj_.size()) + " nodes");
    }
    if (a == b) {
        throw std::invalid_argument("self loop on node " + std::to_string(a));
    }
    if (hasEdge(a, b)) return false;

    adj_[a].push_back(b);
    adj_[b].push_back(a);
    ++edges_;
    return true;
}

void Network::removeEdge(std::uint32_t a, std::uint32_t b) {
    auto& na = adj_[a];
    auto& nb = adj_[b];
    na.erase(std::remove(na.begin(), na.end(), b), na.end());
    nb.erase(std::remove(nb.begin(), nb.end(), a), nb.end());
    --edges_;
}

void Network::finalize() {
    if (finalized_) return;
    computeDistances();
    finalized_ = true;
}

int Network::slotOf(std::uint32_t a, std::uint32_t b) const {
    if (a >= adj_.size()) return -1;
    const auto& nbrs = adj_[a];
    for (std::size_t s = 0; s < nbrs.size(); ++s) {
        if (nbrs[s] == b) return static_cast<int>(s);
    }
    return -1;
}

std::uint32_t Network::hops(std::uint32_t a, std::uint32_t b) const {
    const std::size_t N = adj_.size();
    if (a >= N || b >= N || dist_.empty()) return kUnreachable;
    return dist_[static_cast<std::size_t>(a) * N + b];
}

double Network::distance(std::uint32_t a, std::uint32_t b) const {
    const std::uint32_t h = hops(a, b);
    if (h == kUnreachable) return std::numeric_limits<double>::infinity();
    return static_cast<double>(h);
}

void Network::computeDistances() {
    // One BFS per source; the graph is unweighted
    const std::size_t N = adj_.size();
    dist_.assign(N * N, kUnreachable);
    std::deque<std::uint32_t> frontier;

    for (std::size_t src = 0; src < N; ++src) {
        std::uint32_t* row = dist_.data() + src * N;
        row[src] = 0;
        frontier.clear();
        frontier.push_back(static_cast<std::uint32_t>(src));
        while (!frontier.empty()) {
            const std::uint32_t u = frontier.front();
            frontier.pop_front();
            for (std::uint32_t v : adj_[u]) {
                if (row[v] == kUnreachable) {
                    row[v] = row[u] + 1;
                    frontier.push_back(v);
                }
            }
        }
    }
}
