#include "perception.hpp"
#include <algorithm>
#include <stdexcept>

namespace vision
{

    double DetectedObject::angle() const
    {
        if (const auto *c = std::get_if<ColorObject>(&payload))
            return c->angle;
        if (const auto *c = std::get_if<CodeObject>(&payload))
            return c->angle;
        return 0.0;
    }

    std::string DetectedObject::classname() const
    {
        if (const auto *m = std::get_if<ModelObject>(&payload))
            return m->classname;
        return std::string();
    }

    int DetectedObject::score() const
    {
        if (const auto *m = std::get_if<ModelObject>(&payload))
            return m->score;
        return 0;
    }

    double bearing_for(int center_x, int center_y)
    {
        const double cx = center_x;
        const double cy = center_y;
        return -34.656 + (cx * 0.22539) + (cy * 0.011526) + (cx * cx * -0.000042011) + (cx * cy * 0.000010433) +
               (cy * cy * -0.00007073);
    }

    DetectedObject decode_object(const robot::RawDetection &raw, const std::vector<std::string> &classnames)
    {
        DetectedObject obj;
        obj.type = raw.type;
        obj.id = raw.id;
        obj.origin_x = raw.origin_x;
        obj.origin_y = raw.origin_y;
        obj.width = raw.width;
        obj.height = raw.height;
        obj.center_x = static_cast<int>(raw.origin_x + raw.width / 2.0);
        obj.center_y = static_cast<int>(raw.origin_y + raw.height / 2.0);
        obj.area = raw.width * raw.height;
        obj.bearing = bearing_for(obj.center_x, obj.center_y);

        switch (raw.type)
        {
        case types::kColor:
            obj.payload = ColorObject{raw.angle * 0.01};
            break;
        case types::kCode:
            obj.payload = CodeObject{raw.angle * 0.01};
            break;
        case types::kModel:
        {
            ModelObject m;
            if (raw.id >= 0 && static_cast<size_t>(raw.id) < classnames.size())
                m.classname = classnames[raw.id];
            m.score = raw.score;
            obj.payload = std::move(m);
            break;
        }
        case types::kTag:
            obj.payload = TagObject{raw.corners_x, raw.corners_y};
            break;
        default:
            obj.payload = GenericObject{};
            break;
        }
        return obj;
    }

    std::vector<DetectedObject> PerceptionPipeline::get_data(const robot::VisionState &state, const Descriptor &desc,
                                                             int count)
    {
        return get_data(state, std::vector<Descriptor>{desc}, count);
    }

    std::vector<DetectedObject> PerceptionPipeline::get_data(const robot::VisionState &state,
                                                             const std::vector<Descriptor> &descs, int count)
    {
        if (descs.empty())
            throw std::invalid_argument("descriptor list passed to get_data is empty");
        count = std::clamp(count, 0, kMaxObjects);

        std::vector<DetectedObject> ranked;
        ranked.reserve(state.objects.size());
        for (const auto &raw : state.objects)
        {
            const bool wanted = std::any_of(descs.begin(), descs.end(), [&raw](const Descriptor &d)
                                            { return d.matches(raw.type, raw.id); });
            if (!wanted)
                continue;

            DetectedObject obj = decode_object(raw, state.classnames);
            // Before the first strictly smaller object: equal areas keep arrival order.
            auto pos = std::find_if(ranked.begin(), ranked.end(), [&obj](const DetectedObject &o)
                                    { return o.area < obj.area; });
            ranked.insert(pos, std::move(obj));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (ranked.empty())
            largest_.reset();
        else
            largest_ = ranked.front();
        if (static_cast<int>(ranked.size()) > count)
            ranked.resize(count);
        count_ = static_cast<int>(ranked.size());
        return ranked;
    }

    std::optional<DetectedObject> PerceptionPipeline::largest_object() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return largest_;
    }

    int PerceptionPipeline::object_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

} // namespace vision
