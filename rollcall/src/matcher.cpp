#include "rollcall/matcher.h"

#include <algorithm>
#include <cmath>
#include <limits>

using namespace rollcall;

const char* const rollcall::kUnknownName = "Unknown";

/* ===================== distances ===================== */

static double l2_distance(const Encoding& a, const Encoding& b) {
    double s = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double d = double(a[i]) - double(b[i]);
        s += d * d;
    }
    return std::sqrt(s);
}

static double cosine_distance(const Encoding& a, const Encoding& b) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += double(a[i]) * double(b[i]);
        na  += double(a[i]) * double(a[i]);
        nb  += double(b[i]) * double(b[i]);
    }
    double denom = std::sqrt(na * nb) + 1e-12;
    double cos = std::clamp(dot / denom, -1.0, 1.0);
    return 1.0 - cos;
}

float DistanceMatcher::distance(DistanceMetric metric, const Encoding& a, const Encoding& b) {
    if (a.empty() || a.size() != b.size())
        return std::numeric_limits<float>::infinity();

    switch (metric) {
    case DistanceMetric::Euclidean: return float(l2_distance(a, b));
    case DistanceMetric::Cosine:    return float(cosine_distance(a, b));
    }
    return std::numeric_limits<float>::infinity();
}

std::vector<float> DistanceMatcher::distance(const std::vector<Encoding>& gallery,
                                             const Encoding& candidate) const {
    std::vector<float> out;
    out.reserve(gallery.size());
    for (const auto& known : gallery)
        out.push_back(distance(metric_, known, candidate));
    return out;
}

std::vector<bool> DistanceMatcher::compare(const std::vector<Encoding>& gallery,
                                           const Encoding& candidate,
                                           float tolerance) const {
    std::vector<bool> out;
    out.reserve(gallery.size());
    for (float d : DistanceMatcher::distance(gallery, candidate))
        out.push_back(d <= tolerance);
    return out;
}

/* ===================== identification ===================== */

std::vector<Encoding> rollcall::gallery_encodings(const Gallery& gallery) {
    std::vector<Encoding> known;
    known.reserve(gallery.size());
    for (const auto& face : gallery)
        known.push_back(face.encoding);
    return known;
}

Identity rollcall::identify(const Gallery& gallery, const Matcher& matcher,
                            const Encoding& candidate, float tolerance) {
    return identify(gallery, gallery_encodings(gallery), matcher, candidate, tolerance);
}

Identity rollcall::identify(const Gallery& gallery, const std::vector<Encoding>& known,
                            const Matcher& matcher, const Encoding& candidate, float tolerance) {
    const std::vector<bool> matches = matcher.compare(known, candidate, tolerance);
    const std::vector<float> distances = matcher.distance(known, candidate);

    Identity id;
    if (distances.empty())
        return id;

    auto best = std::min_element(distances.begin(), distances.end());
    id.index = static_cast<int>(best - distances.begin());
    id.distance = *best;

    if (static_cast<size_t>(id.index) < matches.size() && matches[id.index] &&
        static_cast<size_t>(id.index) < gallery.size()) {
        id.name = gallery[id.index].name;
        id.matched = true;
    }
    return id;
}
