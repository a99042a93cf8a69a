// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

// Sample potfuzz target: builds a random convex polygon with 8-bit integer
// coordinates from the seed (Valtr's method) and returns a hash of its
// vertices. Distinct outputs correspond to distinct polygons, so the
// estimate measures how many different polygons the generator reaches.
//
//   potfuzz test ./libpolygon-pot.so --iterations 100000

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <vector>

namespace
{

struct Vec
{
    int32_t x;
    int32_t y;
};

int64_t
cross(Vec const& a, Vec const& b)
{
    return int64_t(a.x) * b.y - int64_t(a.y) * b.x;
}

int64_t
dot(Vec const& a, Vec const& b)
{
    return int64_t(a.x) * b.x + int64_t(a.y) * b.y;
}

// Split sorted values into two monotone chains between the extremes and
// return the edge components of walking up one chain and down the other.
std::vector<int32_t>
chainComponents(std::vector<int32_t> values, std::mt19937_64& rng)
{
    std::sort(values.begin(), values.end());
    int32_t lo = values.front();
    int32_t hi = values.back();
    int32_t last1 = lo;
    int32_t last2 = lo;
    std::vector<int32_t> out;
    out.reserve(values.size());
    for (size_t i = 1; i + 1 < values.size(); ++i)
    {
        if (rng() & 1)
        {
            out.emplace_back(values[i] - last1);
            last1 = values[i];
        }
        else
        {
            out.emplace_back(last2 - values[i]);
            last2 = values[i];
        }
    }
    out.emplace_back(hi - last1);
    out.emplace_back(last2 - hi);
    return out;
}

std::vector<Vec>
randomConvexPolygon(size_t n, std::mt19937_64& rng)
{
    std::uniform_int_distribution<int32_t> coord(-128, 127);
    std::vector<int32_t> xs(n);
    std::vector<int32_t> ys(n);
    for (size_t i = 0; i < n; ++i)
    {
        xs[i] = coord(rng);
        ys[i] = coord(rng);
    }
    int32_t minX = *std::min_element(xs.begin(), xs.end());
    int32_t minY = *std::min_element(ys.begin(), ys.end());

    auto dx = chainComponents(xs, rng);
    auto dy = chainComponents(ys, rng);
    std::shuffle(dy.begin(), dy.end(), rng);

    std::vector<Vec> edges;
    edges.reserve(n);
    for (size_t i = 0; i < n; ++i)
    {
        if (dx[i] != 0 || dy[i] != 0)
        {
            edges.push_back(Vec{dx[i], dy[i]});
        }
    }
    std::sort(edges.begin(), edges.end(), [](Vec const& a, Vec const& b) {
        return std::atan2(double(a.y), double(a.x)) <
               std::atan2(double(b.y), double(b.x));
    });

    // Fold parallel consecutive edges into one so that no vertex is
    // collinear with its neighbours.
    std::vector<Vec> merged;
    for (auto const& e : edges)
    {
        if (!merged.empty() && cross(merged.back(), e) == 0 &&
            dot(merged.back(), e) > 0)
        {
            merged.back().x += e.x;
            merged.back().y += e.y;
        }
        else
        {
            merged.push_back(e);
        }
    }
    if (merged.size() > 1 && cross(merged.back(), merged.front()) == 0 &&
        dot(merged.back(), merged.front()) > 0)
    {
        merged.front().x += merged.back().x;
        merged.front().y += merged.back().y;
        merged.pop_back();
    }

    std::vector<Vec> vertices;
    vertices.reserve(merged.size());
    Vec p{0, 0};
    for (auto const& e : merged)
    {
        vertices.push_back(p);
        p.x += e.x;
        p.y += e.y;
    }

    // Shift into the sampled bounding box.
    int32_t offX = vertices.empty() ? 0 : vertices.front().x;
    int32_t offY = vertices.empty() ? 0 : vertices.front().y;
    for (auto const& v : vertices)
    {
        offX = std::min(offX, v.x);
        offY = std::min(offY, v.y);
    }
    for (auto& v : vertices)
    {
        v.x += minX - offX;
        v.y += minY - offY;
    }

    // Canonical start: lowest, then leftmost vertex.
    auto start = std::min_element(vertices.begin(), vertices.end(),
                                  [](Vec const& a, Vec const& b) {
                                      return a.y < b.y ||
                                             (a.y == b.y && a.x < b.x);
                                  });
    std::rotate(vertices.begin(), start, vertices.end());
    return vertices;
}

uint64_t
fnv1a(std::vector<Vec> const& vertices)
{
    uint64_t h = 0xcbf29ce484222325ULL;
    auto mix = [&h](int32_t v) {
        auto u = static_cast<uint32_t>(v);
        for (int i = 0; i < 4; ++i)
        {
            h ^= (u >> (8 * i)) & 0xff;
            h *= 0x100000001b3ULL;
        }
    };
    mix(static_cast<int32_t>(vertices.size()));
    for (auto const& v : vertices)
    {
        mix(v.x);
        mix(v.y);
    }
    return h;
}
}

extern "C" uint64_t
test(uint64_t seed)
{
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<size_t> sides(3, 10000);
    auto poly = randomConvexPolygon(sides(rng), rng);
    return fnv1a(poly);
}
