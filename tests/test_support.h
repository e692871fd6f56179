#ifndef LUW_TEST_SUPPORT_H
#define LUW_TEST_SUPPORT_H

#include "context.h"
#include "error.h"
#include <map>
#include <string>
#include <vector>

/* Everything a run can be observed by. */
struct RunOutput {
    bool                               ok;
    std::string                        out;
    std::string                        err;
    int                                exit_code;
    LuwError                           error;
    std::map<std::string, std::string> vars;   /* name -> "type:text" */
};

/* A context whose streams are captured instead of written to the terminal. */
class CapturedContext {
public:
    CapturedContext();
    ~CapturedContext();

    ExecContext* get() { return &ctx_; }
    std::string  take_out();
    std::string  take_err();
    std::map<std::string, std::string> vars();

private:
    Stream*     out_;
    Stream*     err_;
    ExecContext ctx_;
};

RunOutput run_interpreted(const std::string& source, const std::vector<std::string>& args = {});
/* compile -> encode -> decode -> VM */
RunOutput run_compiled(const std::string& source, const std::vector<std::string>& args = {});

std::vector<unsigned char> compile_bytes(const std::string& source);

/* A fresh directory under the system temp dir, removed on destruction. */
class TempDir {
public:
    TempDir();
    ~TempDir();
    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }
    void write(const std::string& name, const std::string& content) const;
    std::string read(const std::string& name) const;
    bool exists(const std::string& name) const;

private:
    std::string path_;
};

#endif
