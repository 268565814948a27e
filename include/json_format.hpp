#pragma once
#include <string>
#include <vector>

// Quoted JSON string literal with the mandatory escapes applied.
std::string jsonString(const std::string& value);

std::string jsonStringArray(const std::vector<std::string>& values);

template <typename T>
std::string jsonArray(const std::vector<T>& items) {
    std::string json = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) json += ",";
        json += items[i].toJson();
    }
    json += "]";
    return json;
}
