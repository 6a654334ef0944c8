#include <iostream>
#include <random>
#include "typed.hpp"

// Example usage
using namespace typed;

struct Date
{
    int year;
    int month;
    int day;
};

using Stringable = Interface<"Stringable">;
using DateTime   = Record<Date, "DateTime", Stringable>;
using Birthday   = Record<Date, "Birthday", DateTime>;

struct Application
{
    void run()
    {
        //=============================================================================
        // Sequences
        Sequence numbers("int");
        numbers.append(3, 1, 2);
        numbers.set(5, 10);

        std::cout << numbers << std::endl;
        std::cout << "sorted: " << numbers.sort() << ", sum = " << numbers.sum() << std::endl;

        try
        {
            numbers.append(4, "five", 6);
        }
        catch (TypeMismatch const& e)
        {
            std::cout << "rejected: " << e.what() << " (now " << numbers.size() << " items)" << std::endl;
        }

        std::mt19937 rng(42);
        std::cout << "random pick: " << numbers.chooseRandom(1, rng).front() << std::endl;
        std::cout << std::format("range: {}", Sequence::range(0.0, 1.0, 0.25)) << std::endl;

        //=============================================================================
        // Dictionaries with keys of any kind
        Dictionary lookup(Constraint::any(), "string");
        lookup.add(1, "one (int)");
        lookup.add("1", "one (string)");
        lookup.add(true, "true");
        lookup.add(Array { 1, 2 }, "an array");
        lookup.add(makeObject<Pair>(1.0, "one (float)"));

        for (auto const& [key, value] : lookup)
            std::cout << key << " => " << value << std::endl;

        std::cout << "lookup[1] = " << lookup[1] << std::endl;

        //=============================================================================
        // Nominal types
        Sequence dates("?DateTime");
        dates.append(makeObject<DateTime>(2024, 1, 1));
        dates.append(makeObject<Birthday>(1990, 4, 1));
        dates.set(3, makeObject<DateTime>(2000, 12, 31));

        std::cout << dates << std::endl;

        //=============================================================================
        // Sets
        Set unique(Constraint::infer(), { 1, 2, 2, 3, 3, 3 });
        Set odd("int", { 1, 3, 5 });

        std::cout << unique << " | " << odd << " = " << unique.unite(odd) << std::endl;
        std::cout << unique << " & " << odd << " = " << unique.intersect(odd) << std::endl;
        std::cout << "counts: " << numbers.countValues() << std::endl;
    }
};

int main()
{
    Application app;
    app.run();

    return 0;
}
