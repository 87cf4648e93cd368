#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/mapping/mapping_plan.h"
#include "dbjob/mapping/record.h"
#include "dbjob/cancellation.h"
#include "dbjob/driver.h"
#include "dbjob/exception.h"

#include <bitset>
#include <memory>
#include <optional>
#include <tuple>
#include <typeindex>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

enum class CursorState {
    BeforeFirstSegment,
    InSegment,
    AfterSegment,
    Exhausted
};

const char * toString(CursorState state) noexcept;

using RequiredSlots = std::bitset<DBJOB_MAX_RESULT_SETS>;

// Drives a forward-only cursor into the requested result shape.
// Cancellation is checked before every row and segment advance, and stops reading without an error:
// the policies return what was materialized so far. A driver that aborts a fetch because the
// command was canceled (CanceledError) stops reading the same way.
class ResultReader {
public:
    ResultReader(DriverCursor & cursor_, CommandBehavior behavior_, CancellationToken token_, ColumnMapSettings settings_, bool use_plan_cache_);

    CursorState getState() const noexcept;
    std::size_t getSegmentIndex() const noexcept;
    bool wasCanceled() const noexcept;

    /// Schema of the current segment.
    const ColumnSchema & getColumnSchema() const;

    /// Moves to the next row of the current segment.
    bool nextRow();

    /// Moves to the next segment, skipping unread rows of the current one.
    bool nextSegment();

    /// Maps the current row.
    template <typename T>
    T readCurrent() {
        return mapRow<T>(cursor, planFor<T>());
    }

    template <typename T>
    T first() {
        if (nextRow())
            return readCurrent<T>();

        if (wasCanceled())
            return T{};

        throw JobException(ErrorKind::CardinalityError, ErrorCode::EmptyResult, Component::ResultMaterializer,
            "Result contains no rows", "02000");
    }

    template <typename T>
    std::optional<T> firstOrDefault() {
        if (nextRow())
            return readCurrent<T>();

        return std::nullopt;
    }

    template <typename T>
    T single() {
        auto value = first<T>();
        ensureNoMoreRows();
        return value;
    }

    template <typename T>
    std::optional<T> singleOrDefault() {
        auto value = firstOrDefault<T>();
        if (value)
            ensureNoMoreRows();
        return value;
    }

    /// Remaining rows of the current segment.
    template <typename T>
    std::vector<T> toList() {
        std::vector<T> rows;
        while (nextRow()) {
            try {
                rows.push_back(readCurrent<T>());
            }
            catch (const JobException & ex) {
                if (ex.getKind() != ErrorKind::CanceledError)
                    throw;
                onDriverCanceled();
                break;
            }
        }
        return rows;
    }

    /// Column 0 of row 0, the default value of T if there are no rows.
    template <typename T>
    T scalar() {
        static_assert(shapeKindOf<T>() == ShapeKind::Scalar, "scalar results require a value type");

        if (nextRow())
            return readCurrent<T>();

        return T{};
    }

    /// Remaining rows of the current segment with every column, independent of any mapping.
    DataTable toDataTable();

    /// One table per segment. A table interrupted by cancellation is dropped.
    DataSet toDataSet();

    /// Segment k goes to slot k. Segments beyond the slots are ignored, missing segments leave their slots empty.
    /// A required slot whose segment was never produced raises EmptyResult. A slot interrupted by cancellation is left empty.
    template <typename... Ts>
    std::tuple<std::vector<Ts>...> toMulti(const RequiredSlots & required = RequiredSlots{}) {
        static_assert(sizeof...(Ts) >= 1 && sizeof...(Ts) <= DBJOB_MAX_RESULT_SETS, "unsupported number of result slots");

        std::tuple<std::vector<Ts>...> slots;
        bool stop = false;
        readSlots(slots, required, stop, std::index_sequence_for<Ts...>{});
        return slots;
    }

    /// Rows affected by the statement that produced the current segment.
    std::int64_t getAffectedRowCount() const;

private:
    template <typename T>
    const MappingPlan & planFor() {
        if (!plan || plan_segment != segment_index || plan_type != std::type_index(typeid(T))) {
            plan = getMappingPlan<T>(cursor.getColumnSchema(), settings, use_plan_cache);
            plan_segment = segment_index;
            plan_type = std::type_index(typeid(T));
        }
        return *plan;
    }

    template <typename Tuple, std::size_t... Is>
    void readSlots(Tuple & slots, const RequiredSlots & required, bool & stop, std::index_sequence<Is...>) {
        (readSlot<Is>(std::get<Is>(slots), required[Is], stop), ...);
    }

    template <std::size_t I, typename T>
    void readSlot(std::vector<T> & slot, bool required, bool & stop) {
        if (!stop && I > 0 && !nextSegment())
            stop = true;

        if (stop) {
            if (required && !wasCanceled())
                throwMissingSegment(I);
            return;
        }

        if (I == 0 && required && cursor.getColumnSchema().empty())
            throwMissingSegment(I);

        auto rows = toList<T>();
        if (wasCanceled()) {
            stop = true;
            return;
        }

        slot = std::move(rows);
    }

    [[noreturn]] void throwMissingSegment(std::size_t slot) const;
    void ensureNoMoreRows();
    bool checkCanceled();
    void onDriverCanceled();

private:
    DriverCursor & cursor;
    const CommandBehavior behavior;
    const CancellationToken token;
    const ColumnMapSettings settings;
    const bool use_plan_cache;

    CursorState state = CursorState::BeforeFirstSegment;
    std::size_t segment_index = 0;
    std::size_t rows_in_segment = 0;
    bool canceled = false;

    std::shared_ptr<const MappingPlan> plan;
    std::size_t plan_segment = 0;
    std::type_index plan_type = std::type_index(typeid(void));
};
