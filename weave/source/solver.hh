// weave

#pragma once

#include "weave/canonical_type.hh"

#include "array.hh"
#include "assert.hh"

#include <cstdint>

namespace weave {
    /// Union-find over the variables of a single axis.
    ///
    /// Variables are dense ids. Union is by rank; on equal rank the smaller
    /// id becomes the root so results do not depend on call order. Each root
    /// optionally carries the value the whole class is bound to. Whether two
    /// classes may merge, and what the merged class holds, is decided by
    /// wvUnifyAxis.
    template <typename ValueT>
    class wvAxisSolver
    {
    public:
        explicit wvAxisSolver(wvAllocator& alloc) noexcept : entries_(alloc) {}

        void clear() noexcept { entries_.clear(); }
        uint32_t size() const noexcept { return entries_.size(); }

        wvTypeVarId makeVariable();
        wvTypeVarId makeBound(ValueT const& value);

        wvTypeVarId find(wvTypeVarId var) noexcept;
        wvTypeVarId findConst(wvTypeVarId var) const noexcept;

        bool isBound(wvTypeVarId var) const noexcept { return entries_[findConst(var).value()].bound; }
        ValueT const& value(wvTypeVarId var) const noexcept { return entries_[findConst(var).value()].value; }

        bool canUnify(wvTypeVarId left, wvTypeVarId right) const noexcept;

        // on failure nothing changes and the two bound values are reported
        bool unify(wvTypeVarId left, wvTypeVarId right, ValueT* out_left = nullptr, ValueT* out_right = nullptr) noexcept;
        bool bind(wvTypeVarId var, ValueT const& value) noexcept;

        // the bound value, or the root variable of an unbound class
        wvAxis<ValueT> resolve(wvTypeVarId var) const noexcept;

    private:
        struct Entry
        {
            uint32_t parent = 0;
            uint32_t rank = 0;
            bool bound = false;
            ValueT value = wvAxisDefault<ValueT>::value;
        };

        wvArray<Entry> entries_;
    };

    template <typename ValueT>
    wvTypeVarId wvAxisSolver<ValueT>::makeVariable()
    {
        uint32_t const id = entries_.size();
        entries_.pushBack(Entry{.parent = id});
        return wvTypeVarId{id};
    }

    template <typename ValueT>
    wvTypeVarId wvAxisSolver<ValueT>::makeBound(ValueT const& value)
    {
        uint32_t const id = entries_.size();
        entries_.pushBack(Entry{.parent = id, .bound = true, .value = value});
        return wvTypeVarId{id};
    }

    template <typename ValueT>
    wvTypeVarId wvAxisSolver<ValueT>::find(wvTypeVarId var) noexcept
    {
        WV_ASSERT(var.value() < entries_.size());

        uint32_t root = var.value();
        while (entries_[root].parent != root)
            root = entries_[root].parent;

        // path compression
        uint32_t current = var.value();
        while (entries_[current].parent != root)
        {
            uint32_t const next = entries_[current].parent;
            entries_[current].parent = root;
            current = next;
        }

        return wvTypeVarId{root};
    }

    template <typename ValueT>
    wvTypeVarId wvAxisSolver<ValueT>::findConst(wvTypeVarId var) const noexcept
    {
        WV_ASSERT(var.value() < entries_.size());

        uint32_t root = var.value();
        while (entries_[root].parent != root)
            root = entries_[root].parent;
        return wvTypeVarId{root};
    }

    template <typename ValueT>
    bool wvAxisSolver<ValueT>::canUnify(wvTypeVarId left, wvTypeVarId right) const noexcept
    {
        wvAxis<ValueT> merged = resolve(left);
        return wvUnifyAxis(resolve(left), resolve(right), merged);
    }

    template <typename ValueT>
    bool wvAxisSolver<ValueT>::unify(wvTypeVarId left, wvTypeVarId right, ValueT* out_left, ValueT* out_right) noexcept
    {
        uint32_t const leftRoot = find(left).value();
        uint32_t const rightRoot = find(right).value();
        if (leftRoot == rightRoot)
            return true;

        wvAxis<ValueT> const leftAxis = resolve(wvTypeVarId{leftRoot});
        wvAxis<ValueT> const rightAxis = resolve(wvTypeVarId{rightRoot});
        wvAxis<ValueT> merged = leftAxis;
        if (!wvUnifyAxis(leftAxis, rightAxis, merged))
        {
            if (out_left != nullptr)
                *out_left = leftAxis.value();
            if (out_right != nullptr)
                *out_right = rightAxis.value();
            return false;
        }

        uint32_t root = leftRoot;
        uint32_t child = rightRoot;
        Entry const& leftEntry = entries_[leftRoot];
        Entry const& rightEntry = entries_[rightRoot];
        if (leftEntry.rank < rightEntry.rank || (leftEntry.rank == rightEntry.rank && rightRoot < leftRoot))
        {
            root = rightRoot;
            child = leftRoot;
        }

        Entry& rootEntry = entries_[root];
        Entry& childEntry = entries_[child];

        childEntry.parent = root;
        if (rootEntry.rank == childEntry.rank)
            ++rootEntry.rank;

        if (merged.isResolved())
        {
            rootEntry.bound = true;
            rootEntry.value = merged.value();
        }

        return true;
    }

    template <typename ValueT>
    bool wvAxisSolver<ValueT>::bind(wvTypeVarId var, ValueT const& value) noexcept
    {
        wvTypeVarId const root = find(var);
        wvAxis<ValueT> merged = resolve(root);
        if (!wvUnifyAxis(resolve(root), wvAxis<ValueT>::resolved(value), merged))
            return false;

        Entry& entry = entries_[root.value()];
        entry.bound = true;
        entry.value = merged.value();
        return true;
    }

    template <typename ValueT>
    wvAxis<ValueT> wvAxisSolver<ValueT>::resolve(wvTypeVarId var) const noexcept
    {
        wvTypeVarId const root = findConst(var);
        Entry const& entry = entries_[root.value()];
        if (entry.bound)
            return wvAxis<ValueT>::resolved(entry.value);
        return wvAxis<ValueT>::variable(root);
    }

    // the variables describing the type of one port
    struct wvPortVars
    {
        wvTypeVarId payload{0};
        wvTypeVarId cardinality{0};
        wvTypeVarId temporality{0};
        wvTypeVarId binding{0};
        wvTypeVarId perspective{0};
        wvTypeVarId branch{0};
    };

    class wvTypeSolver
    {
    public:
        explicit wvTypeSolver(wvAllocator& alloc) noexcept
            : payload_(alloc), cardinality_(alloc), temporality_(alloc), binding_(alloc), perspective_(alloc), branch_(alloc)
        {
        }

        void clear() noexcept;

        wvAxisSolver<wvPayload>& payload() noexcept { return payload_; }
        wvAxisSolver<wvCardinality>& cardinality() noexcept { return cardinality_; }
        wvAxisSolver<wvTemporality>& temporality() noexcept { return temporality_; }
        wvAxisSolver<wvBinding>& binding() noexcept { return binding_; }
        wvAxisSolver<wvPerspectiveId>& perspective() noexcept { return perspective_; }
        wvAxisSolver<wvBranchId>& branch() noexcept { return branch_; }

        wvAxisSolver<wvPayload> const& payload() const noexcept { return payload_; }

        // probes every axis without changing anything
        bool canUnify(wvPortVars const& left, wvPortVars const& right, wvAxisConflict* out_conflict = nullptr) const noexcept;

        // all axes or none; the first conflicting axis is reported
        bool unify(wvPortVars const& left, wvPortVars const& right, wvAxisConflict* out_conflict = nullptr) noexcept;

        // binds every unbound non-payload class to its v0 default; runs once
        void applyDefaults() noexcept;
        bool defaultsApplied() const noexcept { return defaultsApplied_; }

        wvCanonicalType resolve(wvPortVars const& vars) const noexcept;

    private:
        template <typename ValueT>
        void bindDefaults(wvAxisSolver<ValueT>& solver) noexcept;

        wvAxisSolver<wvPayload> payload_;
        wvAxisSolver<wvCardinality> cardinality_;
        wvAxisSolver<wvTemporality> temporality_;
        wvAxisSolver<wvBinding> binding_;
        wvAxisSolver<wvPerspectiveId> perspective_;
        wvAxisSolver<wvBranchId> branch_;
        bool defaultsApplied_ = false;
    };
} // namespace weave
