#pragma once

#include <cstdint>

namespace draw2d {

/**
 * Revision counter for the atlas contents.
 *
 * Consumers keep the version they last saw and compare it against the
 * atlas. Revision 0 is never produced by an atlas, so a consumer starting
 * from newOutOfDate() always refreshes on first use.
 */
class AtlasVersion {
public:
    AtlasVersion() = default;

    static AtlasVersion newOutOfDate() { return AtlasVersion(0); }

    bool isOutOfDate(const AtlasVersion& other) const {
        return other.revisionCount_ == 0 || other.revisionCount_ != revisionCount_;
    }

    AtlasVersion increment() const { return AtlasVersion(revisionCount_ + 1); }

    uint32_t revisionCount() const { return revisionCount_; }

    bool operator==(const AtlasVersion& other) const { return revisionCount_ == other.revisionCount_; }
    bool operator!=(const AtlasVersion& other) const { return revisionCount_ != other.revisionCount_; }

private:
    explicit AtlasVersion(uint32_t revisionCount) : revisionCount_(revisionCount) {}

    uint32_t revisionCount_ = 0;
};

} // namespace draw2d
