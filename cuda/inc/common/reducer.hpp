#ifndef _REDUCER_H
#define _REDUCER_H

#include <cstddef>

#include <mpi.h>

/** @file */

/**
 * Sums host buffers across the nodes of a run. One Reducer lives in every process.
 * */
class Reducer {
public:
    virtual ~Reducer() {};

    virtual int Rank() const = 0;
    virtual int Size() const = 0;

    /**
     * In place sum over all nodes.
     * */
    virtual void Allreduce(float* data, size_t count) = 0;
    virtual void Allreduce(double* data, size_t count) = 0;
};

/**
 * Single node run: every reduction is the identity.
 * */
class LocalReducer : public Reducer {
public:
    int Rank() const override { return 0; }
    int Size() const override { return 1; }

    void Allreduce(float*, size_t) override {}
    void Allreduce(double*, size_t) override {}
};

/**
 * Reduces over an MPI communicator. MPI must be initialized by the caller before construction and finalized after
 * destruction.
 * */
class DistributedReducer : public Reducer {
public:
    explicit DistributedReducer(MPI_Comm comm = MPI_COMM_WORLD);

    int Rank() const override { return rank; }
    int Size() const override { return size; }

    void Allreduce(float* data, size_t count) override;
    void Allreduce(double* data, size_t count) override;

private:
    MPI_Comm comm;
    int rank = 0;
    int size = 1;
};

#endif  // _REDUCER_H
