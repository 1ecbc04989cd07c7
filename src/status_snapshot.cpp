#include "status_snapshot.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace robot
{

    using json = nlohmann::json;

    namespace
    {
        // The firmware sends some numbers as JSON strings ("12.5").
        double as_number(const json &v)
        {
            if (v.is_number())
                return v.get<double>();
            if (v.is_string())
                return std::stod(v.get<std::string>());
            if (v.is_boolean())
                return v.get<bool>() ? 1.0 : 0.0;
            throw std::invalid_argument("expected a number, got " + std::string(v.type_name()));
        }

        double number_at(const json &obj, const char *key, double fallback = 0.0)
        {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null())
                return fallback;
            return as_number(*it);
        }

        int int_at(const json &obj, const char *key, int fallback = 0)
        {
            double v = number_at(obj, key, fallback);
            if (!std::isfinite(v) || v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
                throw std::invalid_argument(std::string(key) + " is out of range");
            return static_cast<int>(v);
        }

        uint32_t flags_at(const json &obj, const char *key)
        {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null())
                return 0;
            if (it->is_number_unsigned() || it->is_number_integer())
                return it->get<uint32_t>();
            if (!it->is_string())
                throw std::invalid_argument(std::string(key) + " is not a hex string");
            uint32_t value = 0;
            if (!parse_hex_flags(it->get<std::string>(), value))
                throw std::invalid_argument(std::string(key) + " is not a hex string: " + it->get<std::string>());
            return value;
        }

        Vec3 vec3_at(const json &obj, const char *key)
        {
            Vec3 v;
            auto it = obj.find(key);
            if (it == obj.end() || !it->is_object())
                return v;
            v.x = number_at(*it, "x");
            v.y = number_at(*it, "y");
            v.z = number_at(*it, "z");
            return v;
        }

        const json &section(const json &root, const char *key)
        {
            static const json kEmptyObject = json::object();
            auto it = root.find(key);
            if (it == root.end() || !it->is_object())
                return kEmptyObject;
            return *it;
        }

        void decode_controller(const json &j, ControllerState &c)
        {
            c.flags = flags_at(j, "flags");
            c.stick_x = int_at(j, "stick_x");
            c.stick_y = int_at(j, "stick_y");
            c.battery = int_at(j, "battery");
        }

        void decode_robot(const json &j, RobotState &r)
        {
            r.flags = flags_at(j, "flags");
            r.battery = int_at(j, "battery");
            r.touch_flags = flags_at(j, "touch_flags");
            r.touch_x = number_at(j, "touch_x");
            r.touch_y = number_at(j, "touch_y");
            r.robot_x = number_at(j, "robot_x");
            r.robot_y = number_at(j, "robot_y");
            r.roll = number_at(j, "roll");
            r.pitch = number_at(j, "pitch");
            r.yaw = number_at(j, "yaw");
            r.heading = number_at(j, "heading");
            r.rotation = number_at(j, "rotation");
            r.acceleration = vec3_at(j, "acceleration");
            r.gyro_rate = vec3_at(j, "gyro_rate");
            const json &screen = section(j, "screen");
            r.screen_row = int_at(screen, "row", 1);
            r.screen_column = int_at(screen, "column", 1);
        }

        RawDetection decode_detection(const json &item)
        {
            RawDetection d;
            d.type = static_cast<uint32_t>(int_at(item, "type"));
            d.id = int_at(item, "id");
            d.origin_x = int_at(item, "originx");
            d.origin_y = int_at(item, "originy");
            d.width = int_at(item, "width");
            d.height = int_at(item, "height");
            d.angle = int_at(item, "angle");
            d.score = int_at(item, "score");
            static const char *const kCornerX[4] = {"x0", "x1", "x2", "x3"};
            static const char *const kCornerY[4] = {"y0", "y1", "y2", "y3"};
            for (int i = 0; i < 4; ++i)
            {
                d.corners_x[i] = int_at(item, kCornerX[i]);
                d.corners_y[i] = int_at(item, kCornerY[i]);
            }
            return d;
        }

        void decode_vision(const json &j, VisionState &v)
        {
            const json &classnames = section(j, "classnames");
            if (auto items = classnames.find("items"); items != classnames.end() && items->is_array())
            {
                for (const auto &item : *items)
                {
                    int index = int_at(item, "index", -1);
                    if (index < 0 || index >= VisionState::kMaxClassnames)
                        continue;
                    if (static_cast<size_t>(index) >= v.classnames.size())
                        v.classnames.resize(index + 1);
                    v.classnames[index] = item.value("name", std::string());
                }
            }

            const json &objects = section(j, "objects");
            int count = int_at(objects, "count");
            auto items = objects.find("items");
            if (count <= 0 || items == objects.end() || !items->is_array())
                return;
            size_t n = std::min(static_cast<size_t>(count), items->size());
            v.objects.reserve(n);
            for (size_t i = 0; i < n; ++i)
                v.objects.push_back(decode_detection((*items)[i]));
        }
    } // namespace

    bool parse_hex_flags(const std::string &text, uint32_t &out)
    {
        size_t pos = 0;
        if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
            pos = 2;
        if (pos == text.size() || text.size() - pos > 8)
            return false;
        uint32_t value = 0;
        for (; pos < text.size(); ++pos)
        {
            char c = text[pos];
            uint32_t digit;
            if (c >= '0' && c <= '9')
                digit = c - '0';
            else if (c >= 'a' && c <= 'f')
                digit = 10 + (c - 'a');
            else if (c >= 'A' && c <= 'F')
                digit = 10 + (c - 'A');
            else
                return false;
            value = (value << 4) | digit;
        }
        out = value;
        return true;
    }

    StatusSnapshot empty_snapshot()
    {
        StatusSnapshot s;
        s.vision.classnames = {"SportsBall", "BlueBarrel", "OrangeBarrel", "Robot"};
        s.empty = true;
        return s;
    }

    bool decode_snapshot(const std::string &payload, StatusSnapshot &out, std::string *error)
    {
        try
        {
            json j = json::parse(payload);
            if (!j.is_object())
            {
                if (error)
                    *error = "status payload is not a JSON object";
                return false;
            }
            StatusSnapshot s;
            decode_controller(section(j, "controller"), s.controller);
            decode_robot(section(j, "robot"), s.robot);
            decode_vision(section(j, "aivision"), s.vision);
            s.empty = false;
            out = std::move(s);
            return true;
        }
        catch (const std::exception &e)
        {
            if (error)
                *error = e.what();
            return false;
        }
    }

} // namespace robot
