#include "http/Pages.hpp"

#include "auth/Session.hpp"

#include <format>

namespace tbl::http::pages
{

namespace
{

constexpr std::string_view kSharedStyle = R"(<style>
    :root { color-scheme: light dark; --accent: #4f46e5; }
    * { box-sizing: border-box; font-family: system-ui, -apple-system, "Segoe UI", sans-serif; }
    body { margin: 0; min-height: 100vh; display: flex; align-items: center;
           justify-content: center; background: #020617; color: #f5f5f7; padding: 24px; }
    .card { background: rgba(15,23,42,0.95); border-radius: 18px; padding: 24px 28px;
            max-width: 440px; width: 100%; border: 1px solid rgba(148,163,184,0.35); }
    h1 { margin: 0 0 8px; font-size: 22px; font-weight: 600; }
    p { margin: 6px 0 0; font-size: 13px; opacity: 0.8; }
    input[type="text"] { width: 100%; padding: 10px; border-radius: 10px; margin-top: 12px;
            border: 1px solid rgba(148,163,184,0.7); background: #0f172a; color: inherit; }
    button { margin-top: 14px; width: 100%; border: none; border-radius: 999px; padding: 9px;
             background: var(--accent); color: white; cursor: pointer; }
  </style>)";

} // namespace

std::string html_escape(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char ch : text)
    {
        switch (ch)
        {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\'':
            out += "&#39;";
            break;
        default:
            out.push_back(ch);
        }
    }
    return out;
}

std::string bootstrap_page(std::string_view token)
{
    return std::format(R"(<!doctype html>
<html lang="en">
<head>
  <meta charset="utf-8" />
  <title>tbl - bootstrapping</title>
  <meta name="viewport" content="width=device-width, initial-scale=1" />
  {}
</head>
<body>
  <div class="card">
    <h1>Bootstrapping tbl</h1>
    <p>Securing your local session and loading your workspace.</p>
  </div>
  <script>
    (function() {{
      document.cookie = "{}=" + "{}" + "; SameSite=Lax; Path=/";
      setTimeout(function() {{ window.location.replace("/"); }}, 400);
    }})();
  </script>
</body>
</html>)",
                       kSharedStyle, tbl::auth::kCookieName, token);
}

std::string setup_page()
{
    return std::format(R"(<!doctype html>
<html lang="en">
<head>
  <meta charset="utf-8" />
  <title>tbl - first-time setup</title>
  <meta name="viewport" content="width=device-width, initial-scale=1" />
  {}
</head>
<body>
  <div class="card">
    <h1>Connect your workspace</h1>
    <p>Point <strong>tbl</strong> at a Git repository containing your web UI.
       It is shallow-cloned into your local config and served from there.</p>
    <form method="post" action="/setup">
      <input id="git_url" type="text" name="git_url"
             placeholder="https://github.com/you/your-tbl-web.git" required />
      <button type="submit">Clone &amp; launch</button>
    </form>
    <p>CLI &amp; ENV override: <code>--git-url</code>, <code>TBL_GIT_URL</code></p>
  </div>
</body>
</html>)",
                       kSharedStyle);
}

std::string setup_error_page(std::string_view title, std::string_view detail)
{
    return std::format(R"(<!doctype html>
<html><body>
<h1>{}</h1>
<pre>{}</pre>
<p><a href="/">Back</a></p>
</body></html>)",
                       html_escape(title), html_escape(detail));
}

std::string_view client_script()
{
    static constexpr std::string_view kScript = R"(// tbl.js - helper for tbl's local API
(function () {
  const apiBase = '/api/v1';

  async function request(path, opts) {
    const init = Object.assign(
      { credentials: 'include', headers: { 'Content-Type': 'application/json' } },
      opts || {}
    );
    const res = await fetch(apiBase + path, init);
    if (!res.ok) {
      const text = await res.text().catch(() => '');
      throw new Error('API ' + res.status + ' ' + res.statusText + ': ' + text);
    }
    const ct = res.headers.get('content-type') || '';
    return ct.includes('application/json') ? res.json() : res.text();
  }

  function ping() {
    return request('/ping');
  }

  window.tblApi = { request, ping };
})();
)";
    return kScript;
}

} // namespace tbl::http::pages
