#pragma once

#include <iostream>
#include <vector>


template <typename T>
std::ostream& operator<<(std::ostream& os, const std::vector<T>& vec) {
    os << "{";
    for (size_t i = 0; auto& v : vec) {
        if (i++ != 0) {
            os << ",";
        }
        os << v;
    }
    os << "}";
    return os;
}


template <typename T>
class HeapSingleton {
    static inline T* _instance = nullptr;

protected:
    HeapSingleton() = default;
    ~HeapSingleton() = default;

public:
    static T& instance() {
        if (!_instance) {
            _instance = new T{};
        }
        return *_instance;
    }
};
