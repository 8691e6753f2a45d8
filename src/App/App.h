#ifndef APP_H
#define APP_H

#include <wx/app.h>

#include <string>
#include <vector>

// Console entry point for smv
class App : public wxAppConsole
{
public:
	virtual bool OnInit() override;
	virtual int OnRun() override;

	static std::string Usage();

private:
	static bool WantsVerbose(const std::vector<std::string> &tokens);
	static bool ConfirmOnConsole(const std::string &previewText);
};

#endif // APP_H
