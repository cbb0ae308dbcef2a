#ifndef INCLUDE_FERRIS_TASKS_H_
#define INCLUDE_FERRIS_TASKS_H_

#define ENUM_TASK_TYPE_ \
  X(BUILD) \
  X(RUN)
enum class TaskType {
#define X(name) name,
  ENUM_TASK_TYPE_
#undef X
};

#endif  // INCLUDE_FERRIS_TASKS_H_
