#pragma once

#include <memory>
#include <type_traits>
#include <ycard/result.hpp>

namespace ycard {
namespace base {

// Context type for ObjectFactory - acts as compile-time marker to enforce
// intentional implementation of the factory pattern
struct ObjectFactoryContext {};

// ObjectFactory - enforces create protocol for shared_ptr objects
//
// The create protocol:
//   1. Header declares the interface type (e.g., CardRenderer)
//   2. Cpp defines private subclass (e.g., CardRendererImpl) with init() method
//   3. createImpl() creates the Impl, calls init(), returns Result<Ptr>
//
// Subclass must implement one of (checked in order):
//   1. static Result<Ptr> createImpl(ContextType&, Args...)
//   2. static Result<Ptr> createImpl(Args...)
//   3. static Result<Ptr> createImpl()
//
template<typename T, typename ContextT = ObjectFactoryContext>
class ObjectFactory {
public:
    using ContextType = ContextT;
    using Type = T;
    using Ptr = std::shared_ptr<T>;
    using FactoryType = ObjectFactory<Type, ContextType>;

private:
    // SFINAE: check for static Result<Ptr> createImpl(ContextType&, Args...)
    template<typename FType, typename... Args>
    struct HasCreateImplWithContext {
    private:
        template<typename F>
        static auto check(F*) -> decltype(
            F::Type::createImpl(std::declval<typename F::ContextType&>(),
                               std::declval<Args>()...),
            std::true_type{});
        template<typename>
        static std::false_type check(...);
    public:
        static constexpr bool value =
            std::is_same_v<decltype(check<FType>(nullptr)), std::true_type>;
    };

    // SFINAE: check for static Result<Ptr> createImpl(Args...)
    template<typename FType, typename... Args>
    struct HasCreateImpl {
    private:
        template<typename F>
        static auto check(F*) -> decltype(
            F::Type::createImpl(std::declval<Args>()...),
            std::true_type{});
        template<typename>
        static std::false_type check(...);
    public:
        static constexpr bool value =
            std::is_same_v<decltype(check<FType>(nullptr)), std::true_type>;
    };

    // SFINAE: check for static Result<Ptr> createImpl()
    template<typename FType>
    struct HasCreateImplNoArgs {
    private:
        template<typename F>
        static auto check(F*) -> decltype(F::Type::createImpl(), std::true_type{});
        template<typename>
        static std::false_type check(...);
    public:
        static constexpr bool value =
            std::is_same_v<decltype(check<FType>(nullptr)), std::true_type>;
    };

public:
    template<typename... Args>
    static Result<Ptr> create(Args&&... args) {
        ContextType context;

        if constexpr (HasCreateImplWithContext<FactoryType, Args...>::value) {
            return Type::createImpl(context, std::forward<Args>(args)...);

        } else if constexpr (HasCreateImpl<FactoryType, Args...>::value) {
            return Type::createImpl(std::forward<Args>(args)...);

        } else if constexpr (HasCreateImplNoArgs<FactoryType>::value) {
            return Type::createImpl();

        } else {
            // clang-format off
            static_assert(sizeof(T) == 0,
                "ObjectFactory: No createImpl found.\n"
                "Subclass must implement one of (checked in order):\n"
                "  1. static Result<Ptr> createImpl(ContextType&, Args...)\n"
                "  2. static Result<Ptr> createImpl(Args...)\n"
                "  3. static Result<Ptr> createImpl()\n");
            // clang-format on
            return Err<Ptr>("unreachable");
        }
    }
};

} // namespace base
} // namespace ycard
