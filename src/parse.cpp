#include "parse.h"

#include <stdexcept>

using json = nlohmann::json;

namespace tourplan
{

    static double cost_entry(const json &v)
    {
        if (v.is_null())
            return kUnreachable;
        if (!v.is_number())
            throw std::runtime_error("Matrix entries must be numbers or null.");
        return v.get<double>();
    }

    CostMatrix parse_cost_matrix(const json &matrix_json)
    {
        if (matrix_json.is_array())
        {
            const int n = static_cast<int>(matrix_json.size());
            CostMatrix M(n);
            for (int i = 0; i < n; ++i)
            {
                const auto &row = matrix_json[i];
                if (!row.is_array() || static_cast<int>(row.size()) != n)
                    throw std::runtime_error("Matrix row size mismatch.");
                for (int j = 0; j < n; ++j)
                    M.at(i, j) = cost_entry(row[j]);
            }
            return M;
        }
        if (matrix_json.is_object() && matrix_json.contains("n") && matrix_json.contains("data"))
        {
            const int n = matrix_json["n"].get<int>();
            const auto &data = matrix_json["data"];
            if (n < 0 || !data.is_array() || static_cast<int>(data.size()) != n * n)
                throw std::runtime_error("Matrix 'data' must be flat n*n array.");
            CostMatrix M(n);
            for (int idx = 0; idx < n * n; ++idx)
                M.m[idx] = cost_entry(data[idx]);
            return M;
        }
        throw std::runtime_error("Unsupported matrix JSON format.");
    }

    static std::optional<Coordinate> parse_coord(const json &s)
    {
        if (s.contains("lat") && s.contains("lon"))
            return Coordinate{s["lat"].get<double>(), s["lon"].get<double>()};
        if (s.contains("location") && s["location"].is_object())
        {
            const auto &loc = s["location"];
            return Coordinate{loc.at("lat").get<double>(), loc.at("lon").get<double>()};
        }
        return std::nullopt;
    }

    PlanRequest parse_request(const json &j)
    {
        if (!j.is_object())
            throw std::runtime_error("Request must be a JSON object.");
        PlanRequest r;
        r.departure = j.value("departure", std::string("09:00"));
        if (j.contains("mode"))
            r.mode = parse_travel_mode(j["mode"].get<std::string>());

        if (!j.contains("stops") || !j["stops"].is_array())
            throw std::runtime_error("Request needs a 'stops' array.");
        int i = 0;
        for (const auto &s : j["stops"])
        {
            StopSpec st;
            st.name = s.value("name", "Stop " + std::to_string(i + 1));
            st.address = s.value("address", std::string());
            st.coord = parse_coord(s);
            st.stay_minutes = s.value("stay_minutes", 0);
            if (s.contains("open") && !s["open"].is_null())
                st.open = s["open"].get<std::string>();
            if (s.contains("close") && !s["close"].is_null())
                st.close = s["close"].get<std::string>();
            if (s.contains("mode") && !s["mode"].is_null())
                st.mode = parse_travel_mode(s["mode"].get<std::string>());
            r.stops.push_back(std::move(st));
            ++i;
        }

        if (j.contains("matrix") && !j["matrix"].is_null())
        {
            const auto &m = j["matrix"];
            r.matrix = MatrixPair{parse_cost_matrix(m.at("distance_km")),
                                  parse_cost_matrix(m.at("duration_s"))};
        }

        if (j.contains("gazetteer") && j["gazetteer"].is_object())
        {
            for (auto it = j["gazetteer"].begin(); it != j["gazetteer"].end(); ++it)
            {
                const auto &c = it.value();
                r.gazetteer.emplace(it.key(), Coordinate{c.at("lat").get<double>(), c.at("lon").get<double>()});
            }
        }
        return r;
    }

    std::vector<std::string> stop_names(const PlanRequest &req)
    {
        std::vector<std::string> names;
        names.reserve(req.stops.size());
        for (const auto &s : req.stops)
            names.push_back(s.name);
        return names;
    }

} // namespace tourplan
