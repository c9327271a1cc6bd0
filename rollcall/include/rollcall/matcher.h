#pragma once
#include <string>
#include <vector>

#include "rollcall/face_types.h"

namespace rollcall {

// Distance/similarity service over encodings.
class Matcher {
public:
    virtual ~Matcher() = default;

    // distance from `candidate` to every gallery entry, in gallery order
    virtual std::vector<float> distance(const std::vector<Encoding>& gallery,
                                        const Encoding& candidate) const = 0;

    // per gallery entry: is it the same identity at this tolerance
    virtual std::vector<bool> compare(const std::vector<Encoding>& gallery,
                                      const Encoding& candidate,
                                      float tolerance) const = 0;
};

class DistanceMatcher : public Matcher {
public:
    explicit DistanceMatcher(DistanceMetric metric) : metric_(metric) {}

    std::vector<float> distance(const std::vector<Encoding>& gallery,
                                const Encoding& candidate) const override;
    std::vector<bool> compare(const std::vector<Encoding>& gallery,
                              const Encoding& candidate,
                              float tolerance) const override;

    DistanceMetric metric() const { return metric_; }

    // +infinity when the lengths differ or either side is empty
    static float distance(DistanceMetric metric, const Encoding& a, const Encoding& b);

private:
    DistanceMetric metric_;
};

extern const char* const kUnknownName;

struct Identity {
    std::string name = kUnknownName;
    int index = -1;         // gallery index of the nearest entry, -1 if none
    float distance = 0.0f;  // distance to that entry
    bool matched = false;
};

// Nearest gallery entry wins; it names the face only if the matcher also
// accepts it at `tolerance`. Otherwise the identity stays "Unknown".
Identity identify(const Gallery& gallery, const Matcher& matcher,
                  const Encoding& candidate, float tolerance);

// Same, with the gallery encodings already collected by gallery_encodings().
Identity identify(const Gallery& gallery, const std::vector<Encoding>& known,
                  const Matcher& matcher, const Encoding& candidate, float tolerance);

// encodings of the gallery, in gallery order
std::vector<Encoding> gallery_encodings(const Gallery& gallery);

} // namespace rollcall
