#pragma once
#include "status_snapshot.hpp"
#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vision
{

    // Object type bits as reported in aivision.objects.items[].type
    namespace types
    {
        constexpr uint32_t kColor = 1u << 0;
        constexpr uint32_t kCode = 1u << 1;
        constexpr uint32_t kModel = 1u << 2;
        constexpr uint32_t kTag = 1u << 3;
        constexpr uint32_t kAll = 0x3F;
    } // namespace types

    constexpr int kMatchAllId = 0xFFFF;

    // Which objects a query wants: any type in `type_mask` with this id
    // (kMatchAllId = every id).
    struct Descriptor
    {
        uint32_t type_mask = types::kAll;
        int id = kMatchAllId;

        bool matches(uint32_t type, int object_id) const
        {
            return (type & type_mask) != 0 && (object_id == id || id == kMatchAllId);
        }
    };

    inline Descriptor color(int id) { return Descriptor{types::kColor, id}; }
    inline Descriptor code(int id) { return Descriptor{types::kCode, id}; }
    inline Descriptor model(int id) { return Descriptor{types::kModel, id}; }
    inline Descriptor tag(int id) { return Descriptor{types::kTag, id}; }
    inline Descriptor any(int id) { return Descriptor{types::kAll, id}; }

    // Color signature configured on the sensor (id 1..7).
    struct ColorDescription
    {
        int id = 1;
        int red = 0;
        int green = 0;
        int blue = 0;
        double hangle = 10.0; // allowed hue range
        double hdsat = 0.2;   // allowed saturation range

        Descriptor descriptor() const { return color(id); }
    };

    // Color code: two to five color signatures (id 1..5).
    struct CodeDescription
    {
        int id = 1;
        std::vector<int> color_ids;

        Descriptor descriptor() const { return code(id); }
    };

    // Ready-made descriptors for the default AI model and wildcard queries.
    namespace objects
    {
        const Descriptor kSportsBall = model(0);
        const Descriptor kBlueBarrel = model(1);
        const Descriptor kOrangeBarrel = model(2);
        const Descriptor kRobot = model(3);
        const Descriptor kAllTags = tag(kMatchAllId);
        const Descriptor kAllColors = color(kMatchAllId);
        const Descriptor kAllCodes = code(kMatchAllId);
        const Descriptor kAllModels = model(kMatchAllId);
        const Descriptor kAllObjects = any(kMatchAllId);

        // Any color or code object
        inline std::vector<Descriptor> all_colors() { return {kAllColors, kAllCodes}; }
        // Sports ball or either barrel
        inline std::vector<Descriptor> all_cargo() { return {kSportsBall, kBlueBarrel, kOrangeBarrel}; }
    } // namespace objects

    struct ColorObject
    {
        double angle = 0.0; // degrees
    };

    struct CodeObject
    {
        double angle = 0.0; // degrees
    };

    struct ModelObject
    {
        std::string classname;
        int score = 0;
    };

    struct TagObject
    {
        std::array<int, 4> x{{0, 0, 0, 0}};
        std::array<int, 4> y{{0, 0, 0, 0}};
    };

    struct GenericObject
    {
    };

    using ObjectPayload = std::variant<GenericObject, ColorObject, CodeObject, ModelObject, TagObject>;

    struct DetectedObject
    {
        uint32_t type = 0;
        int id = 0;
        int origin_x = 0;
        int origin_y = 0;
        int width = 0;
        int height = 0;
        int center_x = 0;
        int center_y = 0;
        int area = 0;
        double bearing = 0.0; // degrees, positive to the right
        ObjectPayload payload;

        // Zero for objects without an angle.
        double angle() const;
        // Empty for non-model objects.
        std::string classname() const;
        int score() const;
        // nullptr for non-tag objects.
        const TagObject *tag() const { return std::get_if<TagObject>(&payload); }
    };

    // Calibrated horizontal angle to an object from its pixel centre.
    double bearing_for(int center_x, int center_y);

    DetectedObject decode_object(const robot::RawDetection &raw, const std::vector<std::string> &classnames);

    // Turns the vision part of a status snapshot into ranked objects and
    // remembers the result of the last query.
    class PerceptionPipeline
    {
    public:
        static constexpr int kMaxObjects = 24;
        static constexpr int kDefaultObjects = 8;

        // Matching objects, largest area first, at most min(count, 24).
        std::vector<DetectedObject> get_data(const robot::VisionState &state, const Descriptor &desc,
                                             int count = kDefaultObjects);

        // As above, matching any of `descs`. Throws std::invalid_argument if empty.
        std::vector<DetectedObject> get_data(const robot::VisionState &state, const std::vector<Descriptor> &descs,
                                             int count = kDefaultObjects);

        // Largest match of the last query.
        std::optional<DetectedObject> largest_object() const;

        // Number of objects returned by the last query.
        int object_count() const;

    private:
        mutable std::mutex mutex_;
        std::optional<DetectedObject> largest_;
        int count_ = 0;
    };

} // namespace vision
