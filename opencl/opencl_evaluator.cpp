///////////////////////////
///   IMPORTS SECTION   ///
///////////////////////////
#include "opencl_evaluator.hpp"
#include <cstring>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

///////////////////////////
///   ERROR  CHECKING   ///
///////////////////////////
static inline void checkError(cl_int err, const char* operation) {
    if (err != CL_SUCCESS) {
        std::stringstream ss;
        ss << "OpenCL error during " << operation << ": " << err;
        throw std::runtime_error(ss.str());
    }
}

///////////////////////////
///   RESOURCE GUARDS   ///
///////////////////////////
/// Releases an OpenCL buffer when the enclosing scope ends.
class MemGuard {
public:
    explicit MemGuard(cl_mem mem) : mem_(mem) {}
    ~MemGuard() { if (mem_) clReleaseMemObject(mem_); }

    MemGuard(const MemGuard&) = delete;
    MemGuard& operator=(const MemGuard&) = delete;

    cl_mem& get() { return mem_; }

private:
    cl_mem mem_;
};

/// Releases an OpenCL kernel when the enclosing scope ends.
class KernelGuard {
public:
    explicit KernelGuard(cl_kernel kernel) : kernel_(kernel) {}
    ~KernelGuard() { if (kernel_) clReleaseKernel(kernel_); }

    KernelGuard(const KernelGuard&) = delete;
    KernelGuard& operator=(const KernelGuard&) = delete;

    cl_kernel get() const { return kernel_; }

private:
    cl_kernel kernel_;
};

///////////////////////////
///   OPENCL KERNELS    ///
///////////////////////////
static const char* GRID_KERNEL_SRC = R"(
__kernel void eval_grids(
    __global const int* cellInstructor,    // instructor index per cell, -1 = empty
    __global const int* cellParticipants,  // participant count per cell
    const int numCandidates,
    const int numInstructors,
    const int classrooms,
    const int days,
    const int slots,
    __global int* participantsOut,
    __global int* hoursOut,
    __global int* presenceOut,
    __global int* classroomDaysOut
) {
    int cid = get_global_id(0);
    if (cid >= numCandidates) return;

    int cells = classrooms * days * slots;
    int base = cid * cells;

    int participants = 0;
    int hours = 0;
    int classroomDays = 0;

    // PARTICIPANTS, HOURS, CLASSROOM DAYS
    for (int c = 0; c < classrooms; ++c) {
        for (int d = 0; d < days; ++d) {
            int used = 0;
            for (int s = 0; s < slots; ++s) {
                int idx = base + (c * days + d) * slots + s;
                if (cellInstructor[idx] < 0) continue;
                participants += cellParticipants[idx];
                hours += 1;
                used = 1;
            }
            classroomDays += used;
        }
    }

    // INSTRUCTOR PRESENCE DAYS
    int presence = 0;
    for (int p = 0; p < numInstructors; ++p) {
        for (int d = 0; d < days; ++d) {
            int present = 0;
            for (int c = 0; c < classrooms && !present; ++c) {
                for (int s = 0; s < slots; ++s) {
                    int idx = base + (c * days + d) * slots + s;
                    if (cellInstructor[idx] == p) {
                        present = 1;
                        break;
                    }
                }
            }
            presence += present;
        }
    }

    participantsOut[cid] = participants;
    hoursOut[cid] = hours;
    presenceOut[cid] = presence;
    classroomDaysOut[cid] = classroomDays;
}
)";

///////////////////////////
///  CONTEXT CTOR/DTOR  ///
///////////////////////////
GridOpenCLContext::GridOpenCLContext() {
    cl_int err = CL_SUCCESS;

    cl_uint numPlatforms = 0;
    err = clGetPlatformIDs(0, nullptr, &numPlatforms);
    checkError(err, "getting platform count");
    if (numPlatforms == 0)
        throw std::runtime_error("No OpenCL platforms found.");

    std::vector<cl_platform_id> platforms(numPlatforms);
    err = clGetPlatformIDs(numPlatforms, platforms.data(), nullptr);
    checkError(err, "getting platform IDs");
    platform = platforms[0];

    err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_GPU, 1, &device, nullptr);
    if (err != CL_SUCCESS) {
        std::cout << "No GPU found, trying CPU...\n";
        err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_CPU, 1, &device, nullptr);
        checkError(err, "getting device ID");
    }

    char name[256] = {0};
    err = clGetDeviceInfo(device, CL_DEVICE_NAME, sizeof(name), name, nullptr);
    checkError(err, "querying device name");
    std::cout << "Using OpenCL device: " << name << "\n";

    context = clCreateContext(nullptr, 1, &device, nullptr, nullptr, &err);
    checkError(err, "creating context");

    // The destructor does not run for a half-built context.
    try {
        queue = clCreateCommandQueue(context, device, 0, &err);
        checkError(err, "creating command queue");

        program = buildProgram(GRID_KERNEL_SRC);
    } catch (const std::exception&) {
        release();
        throw;
    }
}

GridOpenCLContext::~GridOpenCLContext() {
    release();
}

void GridOpenCLContext::release() {
    if (queue)   clReleaseCommandQueue(queue);
    if (program) clReleaseProgram(program);
    if (context) clReleaseContext(context);
    queue = nullptr;
    program = nullptr;
    context = nullptr;
}

///////////////////////////
///   BUILD PROGRAM     ///
///////////////////////////
cl_program GridOpenCLContext::buildProgram(const char* src) {
    cl_int err = CL_SUCCESS;
    size_t len = std::strlen(src);
    const char* srcs[1] = { src };
    size_t lens[1] = { len };

    cl_program prog = clCreateProgramWithSource(context, 1, srcs, lens, &err);
    checkError(err, "creating program from source");

    err = clBuildProgram(prog, 1, &device, nullptr, nullptr, nullptr);
    if (err != CL_SUCCESS) {
        size_t logSize = 0;
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &logSize);
        std::vector<char> log(logSize + 1, '\0');
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, logSize, log.data(), nullptr);
        std::cerr << "OpenCL build log:\n" << log.data() << "\n";
        clReleaseProgram(prog);
        throw std::runtime_error("Failed to build OpenCL program");
    }

    return prog;
}

///////////////////////////
///   EVALUATE BATCH    ///
///////////////////////////
void GridOpenCLContext::evaluateBatch(
        const ProblemInstance& inst,
        const std::vector<AssignmentGrid>& batch,
        std::vector<CostBreakdown>& results
) {
    cl_int err = CL_SUCCESS;

    results.clear();
    int numCandidates = (int)batch.size();
    if (numCandidates == 0) return;

    const ScheduleConfig& config = inst.config;
    int classrooms = config.classroomCount;
    int days = config.dayCount;
    int slots = config.slotCount;
    int cells = config.cellCount();

    // Instructor id -> dense index, covering ids that appear only in grids.
    std::map<int, int> instructorIndex;
    for (const Instructor& instructor : inst.instructors) {
        instructorIndex.emplace(instructor.id, (int)instructorIndex.size());
    }

    // Flatten grids
    std::vector<int> cellInstructor((size_t)numCandidates * cells, -1);
    std::vector<int> cellParticipants((size_t)numCandidates * cells, 0);

    for (int g = 0; g < numCandidates; ++g) {
        const AssignmentGrid& grid = batch[g];
        if (grid.cellCount() != cells) {
            throw std::runtime_error("evaluateBatch: grid dimensions differ from the instance configuration");
        }
        for (int i = 0; i < cells; ++i) {
            const std::optional<Lesson>& lesson = grid.at(grid.cellAt(i));
            if (!lesson) continue;
            auto it = instructorIndex.emplace(lesson->instructorId, (int)instructorIndex.size()).first;
            size_t idx = (size_t)g * cells + i;
            cellInstructor[idx] = it->second;
            cellParticipants[idx] = lesson->participantCount();
        }
    }
    int numInstructors = (int)instructorIndex.size();

    size_t bufCellsSize = (size_t)numCandidates * cells * sizeof(int);
    size_t bufOutSize = (size_t)numCandidates * sizeof(int);

    MemGuard d_instructor(clCreateBuffer(context, CL_MEM_READ_ONLY, bufCellsSize, nullptr, &err));
    checkError(err, "creating d_instructor");
    MemGuard d_participants(clCreateBuffer(context, CL_MEM_READ_ONLY, bufCellsSize, nullptr, &err));
    checkError(err, "creating d_participants");

    MemGuard d_participantsOut(clCreateBuffer(context, CL_MEM_WRITE_ONLY, bufOutSize, nullptr, &err));
    checkError(err, "creating d_participantsOut");
    MemGuard d_hoursOut(clCreateBuffer(context, CL_MEM_WRITE_ONLY, bufOutSize, nullptr, &err));
    checkError(err, "creating d_hoursOut");
    MemGuard d_presenceOut(clCreateBuffer(context, CL_MEM_WRITE_ONLY, bufOutSize, nullptr, &err));
    checkError(err, "creating d_presenceOut");
    MemGuard d_classroomDaysOut(clCreateBuffer(context, CL_MEM_WRITE_ONLY, bufOutSize, nullptr, &err));
    checkError(err, "creating d_classroomDaysOut");

    // Upload data
    err = clEnqueueWriteBuffer(queue, d_instructor.get(), CL_TRUE, 0, bufCellsSize, cellInstructor.data(), 0, nullptr, nullptr);
    checkError(err, "writing d_instructor");
    err = clEnqueueWriteBuffer(queue, d_participants.get(), CL_TRUE, 0, bufCellsSize, cellParticipants.data(), 0, nullptr, nullptr);
    checkError(err, "writing d_participants");

    // Kernel + args
    KernelGuard kernel(clCreateKernel(program, "eval_grids", &err));
    checkError(err, "creating kernel");

    int arg = 0;
    err = clSetKernelArg(kernel.get(), arg++, sizeof(cl_mem), &d_instructor.get()); checkError(err, "arg cellInstructor");
    err = clSetKernelArg(kernel.get(), arg++, sizeof(cl_mem), &d_participants.get()); checkError(err, "arg cellParticipants");
    err = clSetKernelArg(kernel.get(), arg++, sizeof(int), &numCandidates); checkError(err, "arg numCandidates");
    err = clSetKernelArg(kernel.get(), arg++, sizeof(int), &numInstructors); checkError(err, "arg numInstructors");
    err = clSetKernelArg(kernel.get(), arg++, sizeof(int), &classrooms); checkError(err, "arg classrooms");
    err = clSetKernelArg(kernel.get(), arg++, sizeof(int), &days); checkError(err, "arg days");
    err = clSetKernelArg(kernel.get(), arg++, sizeof(int), &slots); checkError(err, "arg slots");
    err = clSetKernelArg(kernel.get(), arg++, sizeof(cl_mem), &d_participantsOut.get()); checkError(err, "arg participantsOut");
    err = clSetKernelArg(kernel.get(), arg++, sizeof(cl_mem), &d_hoursOut.get()); checkError(err, "arg hoursOut");
    err = clSetKernelArg(kernel.get(), arg++, sizeof(cl_mem), &d_presenceOut.get()); checkError(err, "arg presenceOut");
    err = clSetKernelArg(kernel.get(), arg++, sizeof(cl_mem), &d_classroomDaysOut.get()); checkError(err, "arg classroomDaysOut");

    size_t global = (size_t)numCandidates;
    err = clEnqueueNDRangeKernel(queue, kernel.get(), 1, nullptr, &global, nullptr, 0, nullptr, nullptr);
    checkError(err, "enqueuing eval_grids");
    err = clFinish(queue);
    checkError(err, "finishing queue");

    std::vector<int> participants(numCandidates);
    std::vector<int> hours(numCandidates);
    std::vector<int> presence(numCandidates);
    std::vector<int> classroomDays(numCandidates);

    err = clEnqueueReadBuffer(queue, d_participantsOut.get(), CL_TRUE, 0, bufOutSize, participants.data(), 0, nullptr, nullptr);
    checkError(err, "reading participants");
    err = clEnqueueReadBuffer(queue, d_hoursOut.get(), CL_TRUE, 0, bufOutSize, hours.data(), 0, nullptr, nullptr);
    checkError(err, "reading hours");
    err = clEnqueueReadBuffer(queue, d_presenceOut.get(), CL_TRUE, 0, bufOutSize, presence.data(), 0, nullptr, nullptr);
    checkError(err, "reading presence");
    err = clEnqueueReadBuffer(queue, d_classroomDaysOut.get(), CL_TRUE, 0, bufOutSize, classroomDays.data(), 0, nullptr, nullptr);
    checkError(err, "reading classroomDays");

    // Revenue in double precision on the host.
    results.resize(numCandidates);
    for (int g = 0; g < numCandidates; ++g) {
        CostBreakdown& b = results[g];
        b.participants = participants[g];
        b.instructorHours = hours[g];
        b.instructorPresenceDays = presence[g];
        b.classroomDays = classroomDays[g];
        b.total = config.ticketPrice * b.participants
                  - config.hourlyPay * b.instructorHours
                  - config.presenceBonus * b.instructorPresenceDays
                  - config.rentalCost * b.classroomDays;
    }
}
