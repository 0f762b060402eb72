#include "delivery.hpp"
#include "geo.hpp"
#include "utils.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using std::vector;

bool Stop::has_coordinates() const {
    return latitude.has_value() && longitude.has_value() && is_valid_coordinate(*latitude, *longitude);
}

void DeliveryProblem::build(const vector<Stop>& valid_stops, const Origin& start_origin, const Origin& depot_origin) {
    stops = valid_stops;
    start = start_origin;
    depot = depot_origin;

    const int n = size();
    costMatrix.assign(n, vector<double>(n, 0.0));
    startDistance.assign(n, 0.0);
    depotDistance.assign(n, 0.0);

    for (int i = 0; i < n; ++i) {
        startDistance[i] = calculate_distance_to_origin(stops[i], start);
        depotDistance[i] = calculate_distance_to_origin(stops[i], depot);
        for (int j = 0; j < n; ++j) {
            if (i != j) {
                costMatrix[i][j] = calculate_distance(stops[i], stops[j]);
            }
        }
    }
}

vector<Stop> DeliveryProblem::stopsInOrder(const vector<int>& visits) const {
    vector<Stop> ordered;
    ordered.reserve(visits.size());
    for (int v : visits) {
        ordered.push_back(stops[v]);
    }
    return ordered;
}

void DeliveryProblem::printData() const {
    std::cout << "=== Delivery Problem ===\n";
    std::cout << "Start: " << start.name << " (lat=" << start.latitude << ", lng=" << start.longitude << ")\n";
    std::cout << "Depot: " << depot.name << " (lat=" << depot.latitude << ", lng=" << depot.longitude << ")\n";
    std::cout << "Stops: " << size() << "\n";
    const std::ios_base::fmtflags flags = std::cout.flags();
    const std::streamsize precision = std::cout.precision();
    std::cout << std::fixed << std::setprecision(2);
    for (int i = 0; i < size(); ++i) {
        const Stop& s = stops[i];
        std::cout << std::setw(4) << i << ": " << s.id << " " << s.customer_name
                  << " [" << s.area << "]"
                  << " start=" << startDistance[i] << "km"
                  << " depot=" << depotDistance[i] << "km";
        if (s.priority) std::cout << " priority=" << *s.priority;
        std::cout << "\n";
    }
    std::cout.flags(flags);
    std::cout.precision(precision);
    std::cout << "========================\n";
}

void split_by_coordinates(const vector<Stop>& stops, vector<Stop>& valid, vector<Stop>& invalid) {
    valid.clear();
    invalid.clear();
    for (const Stop& s : stops) {
        if (s.has_coordinates()) {
            valid.push_back(s);
        } else {
            invalid.push_back(s);
        }
    }
}

static vector<std::string> split_fields(const std::string& line, char separator) {
    vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, separator)) {
        trim(field);
        fields.push_back(field);
    }
    return fields;
}

static bool parse_double(const std::string& text, double& value) {
    try {
        size_t consumed = 0;
        value = std::stod(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_int(const std::string& text, int& value) {
    try {
        size_t consumed = 0;
        value = std::stoi(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool read_stops_from_file(const std::string& filename, vector<Stop>& stops) {
    std::ifstream file(filename);
    if (!file) {
        std::cerr << "Unable to open file: " << filename << std::endl;
        return false;
    }

    enum { ID, ORDER_ID, CUSTOMER, ADDRESS, AREA, LAT, LNG, PHONE, TOTAL, STATUS, PRIORITY, TW_START, TW_END, N_FIELDS };

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        vector<std::string> f = split_fields(line, '|');
        if (f.size() < static_cast<size_t>(LNG + 1) || f[ID].empty()) {
            std::cerr << "WARNING: " << filename << ":" << line_no << ": malformed stop line, skipped." << std::endl;
            continue;
        }
        f.resize(N_FIELDS);

        Stop stop;
        stop.id = f[ID];
        stop.order_id = f[ORDER_ID];
        stop.customer_name = f[CUSTOMER];
        stop.address = f[ADDRESS];
        stop.area = f[AREA];
        stop.delivery_status = f[STATUS];
        if (!f[PHONE].empty()) stop.phone = f[PHONE];

        double lat = 0.0, lng = 0.0;
        bool lat_ok = !f[LAT].empty() && parse_double(f[LAT], lat);
        bool lng_ok = !f[LNG].empty() && parse_double(f[LNG], lng);
        if (lat_ok && lng_ok) {
            stop.latitude = lat;
            stop.longitude = lng;
        } else if (!f[LAT].empty() || !f[LNG].empty()) {
            std::cerr << "WARNING: " << filename << ":" << line_no << ": bad coordinates for stop '"
                      << stop.id << "', treated as not geocoded." << std::endl;
        }

        double total = 0.0;
        if (!f[TOTAL].empty()) {
            if (parse_double(f[TOTAL], total)) {
                stop.total = total;
            } else {
                std::cerr << "WARNING: " << filename << ":" << line_no << ": bad total '" << f[TOTAL] << "'." << std::endl;
            }
        }

        int priority = 0;
        if (!f[PRIORITY].empty()) {
            if (parse_int(f[PRIORITY], priority) && priority >= 1 && priority <= 5) {
                stop.priority = priority;
            } else {
                std::cerr << "WARNING: " << filename << ":" << line_no << ": priority must be 1..5, ignored." << std::endl;
            }
        }

        int tw_start = 0, tw_end = 0;
        if (!f[TW_START].empty() && !f[TW_END].empty()) {
            if (parse_int(f[TW_START], tw_start) && parse_int(f[TW_END], tw_end) && tw_start <= tw_end) {
                stop.time_window = TimeWindow{tw_start, tw_end};
            } else {
                std::cerr << "WARNING: " << filename << ":" << line_no << ": bad time window, ignored." << std::endl;
            }
        }

        stops.push_back(stop);
    }
    return true;
}
