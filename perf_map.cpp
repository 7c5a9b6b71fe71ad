#include <map>

#define DEFAULT_BPTREE_ORDER 32

#include <iostream>
#include <bptree.hpp>
#include <chrono>
#include <cstdlib>
#include <random>
#include <vector>

#define LIMIT 2'000'000
#define SEED 0x114514
using namespace bptree;
template<typename F, typename... Args>
void timeit(F f, Args &&... args) {
    auto start = std::chrono::high_resolution_clock::now();
    f(std::forward<Args>(args)...);
    auto end = std::chrono::high_resolution_clock::now();
    std::cout << "microsecs: " << std::chrono::duration_cast<std::chrono::microseconds>(end - start).count()
              << std::endl;
}

struct Rng {
    std::mt19937_64 engine;
    std::uniform_int_distribution<int> dist;

    Rng() : engine(SEED) {}

    int operator()() {
        return dist(engine);
    }
};

int main(int argc, char **argv) {
    auto limit = argc > 1 ? std::atoi(argv[1]) : LIMIT;
    auto rng = Rng();
    std::vector<int> data(limit);
    std::vector<int> codata(limit);
    for (auto &i : data) {
        i = rng();
    }
    for (auto &i : codata) {
        i = rng();
    }
    {
        std::cout << limit << " insertions (map)" << std::endl;
        timeit([&] {
            std::map<int, int> tester;
            for (int i = 0; i < limit; ++i) {
                tester.insert_or_assign(data[i], data[i]);
            }
        });
    }
    {
        std::cout << limit << " insertions (bptree)" << std::endl;
        timeit([&] {
            BPTree<int, int> tester;
            for (int i = 0; i < limit; ++i) {
                tester.insert(data[i], data[i]);
            }
        });
    }

    auto M = 0;
    {
        std::cout << limit << " lookups (map)" << std::endl;
        std::map<int, int> tester;
        for (int i = 0; i < limit; ++i) {
            tester.insert_or_assign(data[i], data[i]);
        }
        timeit([&] {
            for (int i = 0; i < limit; ++i) {
                M += tester.count(codata[i]);
                M += tester.count(data[i]);
            }
        });
    }

    auto N = 0;
    {
        std::cout << limit << " lookups (bptree)" << std::endl;
        BPTree<int, int> tester;
        for (int i = 0; i < limit; ++i) {
            tester.insert(data[i], data[i]);
        }
        timeit([&] {
            for (int i = 0; i < limit; ++i) {
                N += tester.lookup(codata[i]).has_value();
                N += tester.lookup(data[i]).has_value();
            }
        });
    }
    if (M != N) std::abort();

    size_t A = 0;
    {
        std::cout << limit << " traverse (map)" << std::endl;
        std::map<int, int> tester;
        for (int i = 0; i < limit; ++i) {
            tester.insert_or_assign(data[i], data[i]);
        }
        timeit([&] {
            for (auto &[k, v] : tester) {
                A ^= k;
                A += v;
            }
        });
    }
    size_t B = 0;
    {
        std::cout << limit << " traverse (bptree)" << std::endl;
        BPTree<int, int> tester;
        for (int i = 0; i < limit; ++i) {
            tester.insert(data[i], data[i]);
        }
        timeit([&] {
            tester.traverse([&](const int &k, const int &v) {
                B ^= k;
                B += v;
            });
        });
    }
    if (A != B) std::abort();

    {
        std::cout << limit << " copy construct (map)" << std::endl;
        std::map<int, int> tester;
        for (int i = 0; i < limit; ++i) {
            tester.insert_or_assign(data[i], data[i]);
        }
        timeit([&] {
            auto another = tester;
        });
    }
    {
        std::cout << limit << " copy construct (bptree)" << std::endl;
        BPTree<int, int> tester;
        for (int i = 0; i < limit; ++i) {
            tester.insert(data[i], data[i]);
        }
        timeit([&] {
            auto another = tester;
        });
    }

    for (size_t order : {4, 8, 16, 32, 64, 128, 256}) {
        std::cout << limit << " lookups (bptree, order " << order << ", binary)" << std::endl;
        BPTree<int, int> binary(order);
        BPTree<int, int, false> linear(order);
        for (int i = 0; i < limit; ++i) {
            binary.insert(data[i], data[i]);
            linear.insert(data[i], data[i]);
        }
        size_t X = 0, Y = 0;
        timeit([&] {
            for (int i = 0; i < limit; ++i) {
                X += binary.member(codata[i]);
            }
        });
        std::cout << limit << " lookups (bptree, order " << order << ", linear)" << std::endl;
        timeit([&] {
            for (int i = 0; i < limit; ++i) {
                Y += linear.member(codata[i]);
            }
        });
        if (X != Y || binary.height() != linear.height()) std::abort();
    }
}
