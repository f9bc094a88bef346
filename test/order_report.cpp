#include <lazy.hpp>
#include <indexed.hpp>
#include <iostream>
#include <cassert>

// A real-world -inspired example showcasing some of the lazy:: functionality:
//
// Problem Statement:
//
// Given a stream of order-lines, read incrementally from a single-pass reader,
// build a per-customer revenue report:
//
//      1) Reject the stream if any line has a non-positive quantity.
//
//      2) Drop cancelled lines.
//
//      3) Key lines by "order-id/line-no".
//
//      4) Group by customer-id, in order of first appearance.
//
//      5) Compute per-line revenue within each group.
//
//      6) Resolve customer names from an indexed directory;
//         customers missing from the directory are reported as "(unknown)".
//
// The reader can only be consumed once, while the report reads
// the open lines several times, so the pipeline is cached.
//
namespace example
{

namespace lazy    = lazycoll::lazy;
namespace types   = lazycoll::types;
namespace indexed = lazycoll::indexed;

struct order_line
{
    int64_t     order_id;
    int32_t     line_no;
    std::string customer_id;
    std::string sku;
    int32_t     quantity;
    int64_t     unit_price; // in cents
    bool        cancelled;
};

struct customer
{
    std::string id;
    std::string name;

    bool operator==(const customer& other) const
    {
        return id == other.id;
    }
};

struct report_row
{
    std::string name;
    size_t      num_lines;
    int64_t     revenue; // in cents
};

//---------------------------------------------------------------------------
// Normally the lines would be deserialized from a stream;
// for the sake of example will yield from a vec, counting the reads.
static lazy::producer<order_line> make_reader(std::vector<order_line> lines, size_t& num_read)
{
    return lazy::generate([lines, &num_read, i = 0UL]() mutable -> order_line
    {
        if(i == lines.size()) {
            return lazy::end_seq();
        }
        ++num_read;
        return lines[i++];
    });
}

static types::validator<order_line> positive_quantity()
{
    return { "order-line with positive quantity", [](const order_line& line)
    {
        return line.quantity > 0;
    }};
}

// (1), (2), (3)
static lazy::collection<order_line> open_lines(lazy::producer<order_line> reader)
{
    const auto lines = lazy::collection<order_line>::create(std::move(reader), true);

    return lazy::typed("order-lines", positive_quantity(), lines)

        .filter([](const order_line& line)
        {
            return !line.cancelled;
        })

        .key_by([](const order_line& line)
        {
            return std::to_string(line.order_id) + "/" + std::to_string(line.line_no);
        });
}

// (4), (5), (6)
static std::vector<report_row> revenue_by_customer(
    const lazy::collection<order_line>& lines,
    const indexed::collection<customer>& directory)
{
    const auto revenue = lines

        .group_by([](const order_line& line)
        {
            return line.customer_id;
        })

        .map([](const order_line& line)
        {
            return line.quantity * line.unit_price;
        }, lazy::recursive);

    std::vector<report_row> rows{};

    revenue.each([&](const lazy::collection<int64_t>& group, const lazy::key& customer_id)
    {
        int64_t total = 0;
        group.each([&](int64_t cents)
        {
            total += cents;
        });

        const auto c = directory.get_by("id", customer_id, customer{ customer_id.to_string(), "(unknown)" });
        rows.push_back(report_row{ c.name, group.count(), total });
    });

    return rows;
}

}   // namespace example

//---------------------------------------------------------------------------

int main()
{
    using namespace example;

    indexed::collection<customer> directory{};
    directory.add({ "C1", "Acme" },   { { "id", "C1" } });
    directory.add({ "C2", "Globex" }, { { "id", "C2" }, { "vat", "DE-123" } });

    const std::vector<order_line> input = {
        { 1001, 1, "C1", "SKU-1", 2,  1250, false },
        { 1001, 2, "C1", "SKU-2", 1,   999, true  }, // cancelled.
        { 1002, 1, "C2", "SKU-1", 4,  1250, false },
        { 1003, 1, "C3", "SKU-3", 1, 10000, false }, // not in the directory.
        { 1004, 1, "C1", "SKU-3", 3,   500, false },
    };

    size_t num_read = 0;
    const auto lines = open_lines(make_reader(input, num_read));
    assert(num_read == 0); // nothing is read until the lines are iterated.

    const auto rows = revenue_by_customer(lines, directory);

    for(const auto& row : rows) {
        std::cerr << row.name << "\t" << row.num_lines << "\t" << row.revenue << "\n";
    }

    // customer of the most recent open line, decided when first asked.
    const auto latest = lines.defer([](const lazy::collection<order_line>& self)
    {
        return self.is_empty() ? lazy::maybe<std::string>{}
                               : lazy::maybe<std::string>{ self.last().customer_id };
    });

    const bool report_ok =
           rows.size() == 3
        && rows[0].name == "Acme"      && rows[0].num_lines == 2 && rows[0].revenue == 4000
        && rows[1].name == "Globex"    && rows[1].num_lines == 1 && rows[1].revenue == 5000
        && rows[2].name == "(unknown)" && rows[2].num_lines == 1 && rows[2].revenue == 10000;

    const bool lines_ok =
           lines.count() == 4
        && lines.get("1002/1").customer_id == "C2"
        && lines.keys().to_array().values() == std::vector<lazy::key>{ "1001/1", "1002/1", "1003/1", "1004/1" }
        && latest.first() == "C1"
        && num_read == input.size(); // the reader was consumed once.

    // a bad line aborts the report.
    size_t num_bad_read = 0;
    bool rejected = false;
    try {
        revenue_by_customer(open_lines(make_reader({ input[0], { 2001, 1, "C2", "SKU-1", 0, 1250, false } }, num_bad_read)), directory);
    } catch(const lazy::type_mismatch& e) {
        std::cerr << e.what() << "\n";
        rejected = e.at() == 1;
    }

    assert(report_ok);
    assert(lines_ok);
    assert(rejected);

    return report_ok && lines_ok && rejected ? 0 : 1;
}
