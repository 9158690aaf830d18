#ifndef _COMMUNICATOR_H
#define _COMMUNICATOR_H

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "logger.hpp"
#include "reducer.hpp"
#include "types.hpp"

/** @file */

/**
 * Pool of workers, one per entry of gpus (a device may appear more than once), plus the reducer that joins the
 * pools of different nodes.
 *
 * Replicated arrays are MImage with bBroadcast. After any of the reduce + broadcast calls every replica holds the same
 * bits.
 * */
class Communicator : public MultiGPU {
public:
    Communicator(const std::vector<int>& gpus, bool use_mpi = false);

    Communicator(const Communicator&) = delete;
    Communicator& operator=(const Communicator&) = delete;

    int Rank() const { return reducer->Rank(); }
    int Size() const { return reducer->Size(); }
    bool IsDistributed() const { return reducer->Size() > 1; }

    /**
     * Runs fn(g) for every worker g with its device current.
     * */
    template <typename Function>
    void Map(Function fn) const {
        MGPULOOP(fn(g););
    }

    /**
     * Copies the replica of worker root to all other workers.
     * */
    template <typename Type>
    void Bcast(MImage<Type>& x, int root = 0) const {
        CheckReplicas(x);
        x.BroadcastSync(root);
    }

    /**
     * Averages the replicas into worker 0. The other replicas are left as scratch.
     * */
    template <typename Type>
    void ReduceMean(MImage<Type>& x) const {
        CheckReplicas(x);
        x.ReduceSync();
        Set(0);
        x[0] *= 1.0f / float(GetN());
        ptyCudaCheck(cudaDeviceSynchronize());
    }

    /**
     * Sum over the workers of every node, result in every replica.
     * */
    template <typename Type>
    void Allreduce(MImage<Type>& x) const {
        CheckReplicas(x);
        x.ReduceSync();
        NodeReduce(x[0], 1.0f);
        x.BroadcastSync(0);
    }

    /**
     * Mean over the workers of every node, result in every replica.
     * */
    template <typename Type>
    void AllreduceMean(MImage<Type>& x) const {
        ReduceMean(x);
        NodeReduce(x[0], 1.0f / float(Size()));
        x.BroadcastSync(0);
    }

    /**
     * Sums of per worker host values over workers and nodes.
     * */
    double Allreduce(const std::vector<double>& values) const;
    std::vector<double> AllreduceVector(std::vector<double> values) const;
    double AllreduceMean(const std::vector<double>& values) const;

    /**
     * Contiguous [begin, end) ranges of count items, one per worker, split as MImage splits z slices.
     * */
    std::vector<std::pair<size_t, size_t>> Split(size_t count) const;

    /**
     * Shapes of an array of frames of width x height split by Split(nframes).
     * */
    std::vector<dim3> SplitShape(size_t width, size_t height, size_t nframes) const;

private:
    std::unique_ptr<Reducer> reducer;

    template <typename Type>
    void CheckReplicas(const MImage<Type>& x) const {
        ptyAssert(x.GetN() == GetN(), format("Array of {} workers used on a pool of {}.", x.GetN(), GetN()));
        for (int g = 1; g < GetN(); g++)
            ptyAssert(x[g].size == x[0].size,
                    format("Replica {} has shape {}, worker 0 has {}.", g, x[g].size, x[0].size));
    }

    /**
     * Sums the replica of worker 0 over the nodes and scales it.
     * */
    template <typename Type>
    void NodeReduce(Image<Type>& x, float scale) const {
        static_assert(sizeof(Type) % sizeof(float) == 0, "Node reductions are done in float components.");
        if (reducer->Size() < 2 || x.size == 0) return;

        Set(0);
        std::vector<Type> host(x.size);
        x.CopyTo(host.data());
        reducer->Allreduce((float*)host.data(), x.size * (sizeof(Type) / sizeof(float)));
        x.CopyFrom(host.data());
        x *= scale;
        ptyCudaCheck(cudaDeviceSynchronize());
    }
};

#endif  // _COMMUNICATOR_H
