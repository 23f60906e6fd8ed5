// main.cpp
// Person Example - deep_equal on a struct holding a slice
//
// Builds two person values that differ only in their Hobbies slice:
//   a := person{Name: "A", Age: 22, Hobbies: ["Surfing"]}
//   b := person{Name: "A", Age: 22, Hobbies: []}
// and checks that a equals itself and that a and b diverge at Hobbies.
// Exits with a failure status when either expectation is not met.

#include <deepeq/builders.h>
#include <deepeq/deep_equal.h>
#include <deepeq/heap.h>
#include <deepeq/type.h>

#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <string>
#include <utility>

using namespace deepeq;

// ============================================================
// Types
// ============================================================

const Type* person_type()
{
    static const Type* type = types::define_struct("person", {
        {"Name", types::string_type()},
        {"Age", types::int64_type()},
        {"Hobbies", types::slice_of(types::string_type())},
    });
    return type;
}

Value make_person(Heap& heap, std::string name, std::int64_t age, std::initializer_list<Value> hobbies)
{
    return StructBuilder(person_type())
        .set("Name", std::move(name))
        .set("Age", age)
        .set("Hobbies", heap.make_slice(types::slice_of(types::string_type()), hobbies))
        .finish();
}

// ============================================================
// Main
// ============================================================

int main()
{
    Heap heap;

    const Value a = make_person(heap, "A", 22, {"Surfing"});
    const Value b = make_person(heap, "A", 22, {});

    std::cout << "a = " << a << "\n";
    std::cout << "b = " << b << "\n\n";

    if (auto result = deep_equal(a, a); !result) {
        std::cerr << "not equal: " << *result.divergence << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "deep_equal(a, a): equal\n";

    auto result = deep_equal(a, b);
    if (result) {
        std::cerr << "unexpected equal\n";
        return EXIT_FAILURE;
    }
    std::cout << "deep_equal(a, b): not equal because of: " << *result.divergence << "\n";
    std::cout << "  at " << path_to_string(result.divergence->path()) << "\n\n";

    print_value(b, "b: ");

    return EXIT_SUCCESS;
}
