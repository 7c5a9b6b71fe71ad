#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#define DEBUG_MODE

#include <bptree.hpp>

#define LIMIT 600

using namespace bptree;

using Tree = BPTree<int, std::string>;
using Node = Tree::Node;

std::vector<std::string> leaf_values(const Node *node) {
    std::vector<std::string> values;
    for (size_t i = 0; i < node->value_count(); ++i) {
        values.push_back(node->value_at(i));
    }
    return values;
}

template<typename N>
const N *leftmost(const N *node) {
    while (!node->is_leaf()) node = node->child_at(0);
    return node;
}

template<typename N>
const N *rightmost(const N *node) {
    while (!node->is_leaf()) node = node->child_at(node->child_count() - 1);
    return node;
}

// separators bound their neighbours and split products are at least half full
template<typename N>
void check_split_products(const N *node, size_t order, bool is_root) {
    if (node->is_leaf()) {
        if (!is_root) {
            ASSERT(node->keys.size() >= order / 2);
        }
        return;
    }
    if (!is_root) {
        ASSERT(node->child_count() >= (order + 1) / 2);
    }
    for (size_t i = 0; i < node->keys.size(); ++i) {
        auto &sep = node->keys[i];
        ASSERT(rightmost(node->child_at(i))->keys.back() < sep);
        ASSERT(!(leftmost(node->child_at(i + 1))->keys.front() < sep));
    }
    for (size_t i = 0; i < node->child_count(); ++i) {
        check_split_products(node->child_at(i), order, false);
    }
}

int main(int argc, char **argv) {
    auto seed = argc > 1 ? std::strtoull(argv[1], nullptr, 10) : 0x114514ull;
    std::cout << seed << std::endl;
    std::mt19937_64 rng(seed);

    // order 4: the fourth key overflows the root leaf
    {
        Tree test(4);
        test.insert(5, "a");
        test.insert(3, "b");
        test.insert(8, "c");
        ASSERT(test.height() == 0);
        ASSERT(test.root()->keys == std::vector<int>({3, 5, 8}));
        test.insert(1, "d");
        test.display();
        ASSERT(test.size() == 4);
        ASSERT(test.height() == 1);
        auto root = test.root();
        ASSERT(!root->is_leaf());
        ASSERT(root->keys == std::vector<int>({5}));
        ASSERT(root->child_count() == 2);
        ASSERT(root->child_at(0)->keys == std::vector<int>({1, 3}));
        ASSERT(leaf_values(root->child_at(0)) == std::vector<std::string>({"d", "b"}));
        ASSERT(root->child_at(1)->keys == std::vector<int>({5, 8}));
        ASSERT(leaf_values(root->child_at(1)) == std::vector<std::string>({"a", "c"}));

        std::vector<int> keys;
        std::vector<std::string> values;
        test.traverse([&](const int &k, const std::string &v) {
            keys.push_back(k);
            values.push_back(v);
        });
        ASSERT(keys == std::vector<int>({1, 3, 5, 8}));
        ASSERT(values == std::vector<std::string>({"d", "b", "a", "c"}));

        // replacing a value leaves the shape alone
        auto replaced = test.insert(3, "z");
        ASSERT(replaced == std::string("b"));
        ASSERT(test.root() == root);
        ASSERT(test.size() == 4);
        ASSERT(root->child_at(0)->keys == std::vector<int>({1, 3}));
        ASSERT(test.lookup(3) == std::string("z"));
        ASSERT(test.valid());
    }
    ASSERT(alive_node == 0);

    // order 3: ascending keys split the leaves and then the root branch
    {
        Tree test(3);
        for (int i = 1; i <= 5; ++i) {
            test.insert(i, std::to_string(i));
        }
        test.display();
        ASSERT(test.height() == 2);
        auto root = test.root();
        ASSERT(root->keys == std::vector<int>({3}));
        auto left = root->child_at(0);
        auto right = root->child_at(1);
        ASSERT(left->keys == std::vector<int>({2}));
        ASSERT(right->keys == std::vector<int>({4}));
        ASSERT(left->child_at(0)->keys == std::vector<int>({1}));
        ASSERT(left->child_at(1)->keys == std::vector<int>({2}));
        ASSERT(right->child_at(0)->keys == std::vector<int>({3}));
        ASSERT(right->child_at(1)->keys == std::vector<int>({4, 5}));
        for (int i = 1; i <= 5; ++i) {
            ASSERT(test.lookup(i) == std::to_string(i));
        }
        ASSERT(!test.lookup(0));
        ASSERT(!test.lookup(6));
    }
    ASSERT(alive_node == 0);

    // order 5: a leaf of five keys splits at index 2
    {
        Tree test(5);
        for (int i : {4, 2, 5, 1, 3}) {
            test.insert(i * 10, std::to_string(i));
        }
        auto root = test.root();
        ASSERT(root->keys == std::vector<int>({30}));
        ASSERT(root->child_at(0)->keys == std::vector<int>({10, 20}));
        ASSERT(root->child_at(1)->keys == std::vector<int>({30, 40, 50}));
        ASSERT(test.lookup(30) == std::string("3"));
        ASSERT(!test.lookup(35));
    }
    ASSERT(alive_node == 0);

    // a key equal to a separator lives to its right
    {
        Tree test(3);
        for (int i : {10, 20, 30}) {
            test.insert(i, std::to_string(i));
        }
        auto root = test.root();
        ASSERT(root->keys == std::vector<int>({20}));
        ASSERT(root->child_at(1)->keys.front() == 20);
        test.insert(20, "twenty");
        ASSERT(root->child_at(1)->keys == std::vector<int>({20, 30}));
        ASSERT(root->child_at(0)->keys == std::vector<int>({10}));
        ASSERT(test.lookup(20) == std::string("twenty"));
    }
    ASSERT(alive_node == 0);

    for (size_t order = 3; order <= 12; ++order) {
        std::vector<int> keys(LIMIT);
        for (size_t i = 0; i < keys.size(); ++i) keys[i] = static_cast<int>(i);
        for (int pattern = 0; pattern < 3; ++pattern) {
            if (pattern == 1) std::reverse(keys.begin(), keys.end());
            if (pattern == 2) std::shuffle(keys.begin(), keys.end(), rng);
            Tree test(order);
            size_t roots = 0;
            auto root = test.root();
            for (auto k : keys) {
                auto before = test.height();
                test.insert(k, "");
                if (test.root() != root) {
                    root = test.root();
                    roots++;
                    ASSERT(test.height() == before + 1);
                    ASSERT(root->keys.size() == 1 && root->child_count() == 2);
                }
            }
            ASSERT(roots == test.height());
            ASSERT(test.size() == keys.size());
            ASSERT(test.valid());
            check_split_products(test.root(), order, true);
            for (auto k : keys) {
                ASSERT(test.member(k));
            }
        }
    }
    ASSERT(alive_node == 0);
    return 0;
}
