#include <climits>

#include "logger.hpp"
#include "reducer.hpp"

namespace {

void MpiCheck(int res, const char* call) {
    if (res == MPI_SUCCESS) return;

    char msg[MPI_MAX_ERROR_STRING];
    int len = 0;
    MPI_Error_string(res, msg, &len);
    ptyError(format("{} failed: {}", call, string(msg, len)));
    throw PtyException(format("{} failed: {}", call, string(msg, len)));
}

}  // namespace

DistributedReducer::DistributedReducer(MPI_Comm _comm) : comm(_comm) {
    int initialized = 0;
    MpiCheck(MPI_Initialized(&initialized), "MPI_Initialized");
    ptyAssert(initialized, "DistributedReducer needs MPI_Init to be called first.");

    MpiCheck(MPI_Comm_rank(comm, &rank), "MPI_Comm_rank");
    MpiCheck(MPI_Comm_size(comm, &size), "MPI_Comm_size");
    ptyDebug(format("Node reducer rank {} of {}.", rank, size));
}

void DistributedReducer::Allreduce(float* data, size_t count) {
    ptyAssert(count <= size_t(INT_MAX), format("Cannot reduce {} values in one call.", count));
    if (count == 0) return;
    MpiCheck(MPI_Allreduce(MPI_IN_PLACE, data, int(count), MPI_FLOAT, MPI_SUM, comm), "MPI_Allreduce");
}

void DistributedReducer::Allreduce(double* data, size_t count) {
    ptyAssert(count <= size_t(INT_MAX), format("Cannot reduce {} values in one call.", count));
    if (count == 0) return;
    MpiCheck(MPI_Allreduce(MPI_IN_PLACE, data, int(count), MPI_DOUBLE, MPI_SUM, comm), "MPI_Allreduce");
}
