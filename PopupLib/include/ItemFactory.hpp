#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

/**
 * @class ItemFactory
 * @brief Generic factory for constructing items by string key.
 *
 * ItemFactory maps string identifiers to constructor functions. PopupKit
 * uses it to create popup painters by style name:
 *
 * @code
 * ItemFactory<PopupPainter> painters;
 * painters.registerItem("bordered", [] { return std::make_unique<NinePatchPainter>(":/popup/bordered.9.png"); });
 * auto painter = painters.createItem("bordered");
 * @endcode
 *
 * @tparam T Base type of items created by the factory.
 */
template<typename T>
class ItemFactory
{
public:
    ItemFactory() = default;

    /// Functor used to create new items.
    using CreateFunc = std::function<std::unique_ptr<T>()>;

    /**
     * @brief Register a new item type under a name.
     *
     * If the name already exists, the previous entry is replaced.
     */
    void registerItem(const std::string& name, CreateFunc createFunc)
    {
        registry[name] = std::move(createFunc);
    }

    /**
     * @brief Create an item instance by name.
     *
     * @return A newly constructed unique_ptr<T>, or nullptr if not found.
     */
    std::unique_ptr<T> createItem(const std::string& name) const
    {
        if (auto it = registry.find(name); it != registry.end())
        {
            return it->second();
        }
        return nullptr;
    }

private:
    /// Map of registered item names to constructor functions.
    std::unordered_map<std::string, CreateFunc> registry;
};
