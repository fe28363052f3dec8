#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

/**
 * @file Sequence.hpp
 * @brief Ленивая конечная перезапускаемая последовательность
 */

/**
 * @brief Ленивая последовательность значений T
 *
 * Хранит фабрику генераторов: каждый вызов begin() создаёт новый генератор,
 * поэтому последовательность можно пройти повторно с начала.
 * Генератор возвращает std::nullopt, когда значения закончились.
 *
 * @code
 * Sequence<int> seq = Sequence<int>::fromVector({1, 2, 3});
 * for (int v : seq) { ... }
 * @endcode
 */
template <typename T>
class Sequence {
public:
    using Generator = std::function<std::optional<T>()>;
    using Factory = std::function<Generator()>;

    /**
     * @brief Входной итератор, вытягивающий значения из генератора
     */
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        Iterator() = default;

        explicit Iterator(std::shared_ptr<Generator> generator)
            : generator_(std::move(generator))
        {
            advance();
        }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        Iterator& operator++() {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        bool operator==(const Iterator& other) const {
            return atEnd() == other.atEnd();
        }

        bool operator!=(const Iterator& other) const {
            return !(*this == other);
        }

    private:
        std::shared_ptr<Generator> generator_;
        std::optional<T> current_;

        bool atEnd() const { return !current_.has_value(); }

        void advance() {
            if (generator_ && *generator_) {
                current_ = (*generator_)();
            } else {
                current_.reset();
            }
        }
    };

    Sequence() : factory_([] { return Generator([] { return std::optional<T>(); }); }) {}

    explicit Sequence(Factory factory) : factory_(std::move(factory)) {}

    Iterator begin() const {
        return Iterator(std::make_shared<Generator>(factory_()));
    }

    Iterator end() const { return Iterator(); }

    /**
     * @brief Материализовать последовательность
     */
    std::vector<T> toVector() const {
        std::vector<T> result;
        for (const auto& value : *this) {
            result.push_back(value);
        }
        return result;
    }

    /**
     * @brief Последовательность поверх неизменяемого снимка
     */
    static Sequence fromSnapshot(std::shared_ptr<const std::vector<T>> snapshot) {
        return Sequence([snapshot]() {
            auto index = std::make_shared<size_t>(0);
            return Generator([snapshot, index]() -> std::optional<T> {
                if (*index >= snapshot->size()) {
                    return std::nullopt;
                }
                return (*snapshot)[(*index)++];
            });
        });
    }

    static Sequence fromVector(std::vector<T> values) {
        return fromSnapshot(std::make_shared<const std::vector<T>>(std::move(values)));
    }

    /**
     * @brief Лениво отфильтрованная последовательность
     */
    Sequence filter(std::function<bool(const T&)> predicate) const {
        Factory source = factory_;
        return Sequence([source, predicate]() {
            auto generator = std::make_shared<Generator>(source());
            return Generator([generator, predicate]() -> std::optional<T> {
                while (auto value = (*generator)()) {
                    if (predicate(*value)) {
                        return value;
                    }
                }
                return std::nullopt;
            });
        });
    }

private:
    Factory factory_;
};
