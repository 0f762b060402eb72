/*
 * delivery.hpp
 * Stops, origins and the instance handed to one search.
 */
#ifndef DELIVERY_HPP
#define DELIVERY_HPP

#include <optional>
#include <string>
#include <vector>

struct TimeWindow {
    int start_hour; // 9 for 09:00
    int end_hour;   // 17 for 17:00
};

class Stop {
public:
    std::string id;
    std::string order_id;
    std::string customer_name;
    std::string address;
    std::string area;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<std::string> phone;
    double total = 0.0;
    std::string delivery_status;
    std::optional<int> priority; // 1 (highest) .. 5 (lowest)
    std::optional<TimeWindow> time_window;

    bool has_coordinates() const;
};

class Origin {
public:
    double latitude = 0.0;
    double longitude = 0.0;
    std::string name;
    std::string address;
};

/**
 * @class DeliveryProblem
 * @brief Geocoded stops of one optimization call plus their distance tables.
 *
 * Routes refer to stops by their index in 'stops'. The search starts at
 * 'start' (the depot, or the driver's live position) and always closes the
 * loop at 'depot'.
 */
class DeliveryProblem {
public:
    std::vector<Stop> stops;
    Origin start;
    Origin depot;
    std::vector<std::vector<double>> costMatrix; // stop -> stop, km
    std::vector<double> startDistance;           // start -> stop, km
    std::vector<double> depotDistance;           // stop -> depot, km

    void build(const std::vector<Stop>& valid_stops, const Origin& start_origin, const Origin& depot_origin);
    int size() const { return static_cast<int>(stops.size()); }
    std::vector<Stop> stopsInOrder(const std::vector<int>& visits) const;
    void printData() const;
};

// Splits stops into geocoded and non-geocoded ones, keeping input order.
void split_by_coordinates(const std::vector<Stop>& stops, std::vector<Stop>& valid, std::vector<Stop>& invalid);

/**
 * @brief Reads stops from a '|' separated file.
 *
 * Line layout:
 * id|order_id|customer_name|address|area|latitude|longitude|phone|total|delivery_status|priority|tw_start|tw_end
 * Empty fields are absent values. Malformed lines are skipped with a warning.
 *
 * @return false if the file cannot be opened.
 */
bool read_stops_from_file(const std::string& filename, std::vector<Stop>& stops);

#endif // DELIVERY_HPP
