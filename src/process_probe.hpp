#pragma once

#include <string>

namespace deskbridge {

enum class ProbeResult { kRunning, kNotRunning, kUnknown };

const char* ProbeResultName(ProbeResult r);

class ProcessProbe {
 public:
  virtual ~ProcessProbe() = default;

  virtual ProbeResult ProbePid(long pid) const = 0;
  virtual ProbeResult ProbeName(const std::string& name) const = 0;
};

// Probes the local process table: kill(pid, 0) for pids and a /proc scan
// for names. Inside a WSL guest a name that is not found locally is also
// looked up on the host through tasklist.exe, because host processes are
// invisible to the guest's /proc.
class SystemProcessProbe : public ProcessProbe {
 public:
  SystemProcessProbe();

  ProbeResult ProbePid(long pid) const override;
  ProbeResult ProbeName(const std::string& name) const override;

 private:
  ProbeResult ProbeProcTable(const std::string& name) const;
  ProbeResult ProbeHostTaskList(const std::string& name) const;

  bool in_guest_;
};

// Stops and starts an application by image name and executable path.
class ProcessControl {
 public:
  virtual ~ProcessControl() = default;

  virtual bool Terminate(const std::string& name, std::string* err) = 0;
  virtual bool Launch(const std::string& executable, std::string* err) = 0;
};

// Windows images (`*.exe`, or any name inside a WSL guest) are stopped with
// taskkill.exe, local ones with pkill. Launch detaches the new process from
// this one. A host-syntax executable path is run through its /mnt mount.
class SystemProcessControl : public ProcessControl {
 public:
  SystemProcessControl();

  bool Terminate(const std::string& name, std::string* err) override;
  bool Launch(const std::string& executable, std::string* err) override;

 private:
  bool in_guest_;
};

}  // namespace deskbridge
